/* Unit tests for the sysfs device model.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <criterion/criterion.h>

#include <driverctl/exceptions.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/kernel/kernel.hpp>
#include <driverctl/utils.hpp>

#include "sysfs_fixture.hpp"

using namespace driverctl;
using namespace driverctl::kernel::devices;
using driverctl::test::SysfsFixture;

// Put a modprobe script with the given body first on PATH.
// The driver name is passed as $2, after -q.
static void fakeModprobe(const SysfsFixture &fx, const std::string &body) {
  auto bin = fx.base / "bin";
  auto script = bin / "modprobe";

  fs::create_directories(bin);
  SysfsFixture::write(script, "#!/bin/sh\n" + body + "\n");
  fs::permissions(script, fs::perms::owner_all);

  const char *path = getenv("PATH");
  auto value = bin.string() + ":" + (path ? path : "/usr/bin:/bin");
  setenv("PATH", value.c_str(), 1);
}

// cppcheck-suppress unknownMacro
TestSuite(sysfs, .description = "Sysfs device model");

Test(sysfs, paths) {
  Bus bus("pci", "/sys");

  cr_assert_eq(bus.path(), fs::path("/sys/bus/pci"));
  cr_assert_eq(bus.devices_path(), fs::path("/sys/bus/pci/devices"));
  cr_assert_eq(bus.drivers_path(), fs::path("/sys/bus/pci/drivers"));
  cr_assert_eq(bus.probe_path(), fs::path("/sys/bus/pci/drivers_probe"));
}

Test(sysfs, device_attributes) {
  SysfsFixture fx;
  fx.addDriver("e1000e");
  auto path = fx.addDevice("0000:03:00.0");
  fx.bind("0000:03:00.0", "e1000e");

  Bus bus("pci", fx.sysfs);
  auto dev = bus.device(path);

  cr_assert_eq(dev->name(), "0000:03:00.0");
  cr_assert_eq(dev->class_code(), "0x020000");
  cr_assert(dev->overridable());

  auto id = dev->id();
  cr_assert_eq(id.vendor, 0x8086u);
  cr_assert_eq(id.device, 0x10d3u);

  auto drv = dev->driver();
  cr_assert(drv.has_value());
  cr_assert_eq((*drv)->name(), "e1000e");
}

Test(sysfs, override_value) {
  SysfsFixture fx;
  auto path = fx.addDevice("0000:03:00.0");

  Bus bus("pci", fx.sysfs);
  auto dev = bus.device(path);

  // "(null)" is what the kernel reports for an unset override
  cr_assert_not(dev->override_value().has_value());

  dev->override("vfio-pci");
  cr_assert_eq(*dev->override_value(), "vfio-pci");

  dev->override("");
  cr_assert_not(dev->override_value().has_value());
}

Test(sysfs, not_overridable) {
  SysfsFixture fx;
  auto path = fx.addDevice("0000:00:00.0", "0x060000", false);

  Bus bus("pci", fx.sysfs);
  auto dev = bus.device(path);

  cr_assert_not(dev->overridable());
  cr_assert_not(dev->override_value().has_value());
  cr_assert_not(dev->driver().has_value());
}

Test(sysfs, unbind_and_probe_writes) {
  SysfsFixture fx;
  fx.addDriver("e1000e");
  auto path = fx.addDevice("0000:03:00.0");

  Bus bus("pci", fx.sysfs);
  auto dev = bus.device(path);

  bus.driver("e1000e")->unbind(*dev);
  cr_assert_eq(*utils::read_from_file(bus.drivers_path() / "e1000e" / "unbind"),
               "0000:03:00.0");

  bus.driver("e1000e")->add_id(*dev);
  cr_assert_eq(*utils::read_from_file(bus.drivers_path() / "e1000e" / "new_id"),
               "8086 10d3");

  dev->probe();
  cr_assert_eq(*utils::read_from_file(bus.probe_path()), "0000:03:00.0");
}

Test(sysfs, write_to_missing_attribute) {
  SysfsFixture fx;

  cr_assert_throw(utils::write_to_file("x", fx.sysfs / "missing"),
                  std::system_error);
}

Test(sysfs, devices_sorted) {
  SysfsFixture fx;
  fx.addDevice("0000:03:00.0");
  fx.addDevice("0000:00:1f.2");
  fx.addDevice("0000:00:02.0", "0x030000");

  Bus bus("pci", fx.sysfs);
  auto devs = bus.devices();

  cr_assert_eq(devs.size(), 3u);
  cr_assert_eq(devs[0]->name(), "0000:00:02.0");
  cr_assert_eq(devs[1]->name(), "0000:00:1f.2");
  cr_assert_eq(devs[2]->name(), "0000:03:00.0");

  cr_assert(Bus("usb", fx.sysfs).devices().empty());
}

Test(sysfs, has_driver) {
  SysfsFixture fx;
  fx.addDriver("e1000e");

  Bus bus("pci", fx.sysfs);

  cr_assert(bus.has_driver("e1000e"));
  cr_assert_not(bus.has_driver("vfio-pci"));
}

Test(sysfs, module_names) {
  cr_assert_eq(kernel::moduleName("vfio-pci"), "vfio_pci");
  cr_assert_eq(kernel::moduleName("e1000e"), "e1000e");
}

Test(sysfs, module_loaded) {
  SysfsFixture fx;
  auto modules = fx.base / "modules";

  SysfsFixture::write(modules, "vfio_pci 16384 0 - Live 0x0\n"
                               "vfio_pci_core 94208 1 vfio_pci, Live 0x0\n"
                               "e1000e 331776 0 - Live 0x0\n");

  cr_assert_eq(kernel::isModuleLoaded("vfio-pci", modules), 0);
  cr_assert_eq(kernel::isModuleLoaded("e1000e", modules), 0);
  cr_assert_neq(kernel::isModuleLoaded("vfio", modules), 0);
  cr_assert_neq(kernel::isModuleLoaded("igb", modules), 0);
  cr_assert_neq(kernel::isModuleLoaded("igb", fx.base / "missing"), 0);
}

Test(sysfs, load_driver) {
  SysfsFixture fx;
  Bus bus("pci", fx.sysfs);

  fakeModprobe(fx, "mkdir -p \"" + bus.drivers_path().string() + "/$2\"");

  bus.load_driver("driverctl-unit-test");

  cr_assert(bus.has_driver("driverctl-unit-test"));
}

Test(sysfs, load_driver_without_driver) {
  SysfsFixture fx;
  Bus bus("pci", fx.sysfs);

  // Module loads, but registers no driver of that name on the bus
  fakeModprobe(fx, "exit 0");

  cr_assert_throw(bus.load_driver("driverctl-unit-test"), ModuleLoadFailed);
}

Test(sysfs, load_driver_modprobe_failed) {
  SysfsFixture fx;
  Bus bus("pci", fx.sysfs);

  fakeModprobe(fx, "exit 1");

  cr_assert_throw(bus.load_driver("driverctl-unit-test"), ModuleLoadFailed);
  cr_assert_eq(kernel::loadModule("driverctl-unit-test"), -1);
}
