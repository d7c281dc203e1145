/* Simulated sysfs tree and kernel for unit tests.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <driverctl/context.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/executor.hpp>
#include <driverctl/fs.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/kernel/devices/bus_device.hpp>
#include <driverctl/kernel/devices/linux_driver.hpp>
#include <driverctl/utils.hpp>

namespace driverctl {
namespace test {

// A sysfs like directory tree below a temporary directory:
//
//   <base>/sys/bus/<bus>/{devices,drivers,drivers_probe}
//   <base>/sys/devices/<bus>0000:00/<id>/{class,vendor,device,driver_override}
//   <base>/driverctl.d
class SysfsFixture {
public:
  fs::path base;
  fs::path sysfs;
  fs::path persist;

  SysfsFixture() {
    char tpl[] = "/tmp/driverctl.unit-test.XXXXXX";
    if (!mkdtemp(tpl))
      throw SystemError("Failed to create temporary directory");

    base = tpl;
    sysfs = base / "sys";
    persist = base / "driverctl.d";

    addBus("pci");
  }

  ~SysfsFixture() {
    std::error_code ec;
    fs::remove_all(base, ec);
  }

  static void write(const fs::path &file, const std::string &content) {
    std::ofstream f(file, std::ios::trunc);
    f << content;
  }

  fs::path busPath(const std::string &bus) const {
    return sysfs / "bus" / bus;
  }

  fs::path devicePath(const std::string &bus, const std::string &id) const {
    return sysfs / "devices" / (bus + "0000:00") / id;
  }

  void addBus(const std::string &bus) {
    fs::create_directories(busPath(bus) / "devices");
    fs::create_directories(busPath(bus) / "drivers");
    write(busPath(bus) / "drivers_probe", "");
  }

  void addDriver(const std::string &name, const std::string &bus = "pci") {
    auto dir = busPath(bus) / "drivers" / name;

    fs::create_directories(dir);
    write(dir / "unbind", "");
    write(dir / "new_id", "");
  }

  fs::path addDevice(const std::string &id,
                     const std::string &cls = "0x020000",
                     bool overridable = true,
                     const std::string &bus = "pci") {
    auto dir = devicePath(bus, id);

    fs::create_directories(dir);
    write(dir / "class", cls + "\n");
    write(dir / "vendor", "0x8086\n");
    write(dir / "device", "0x10d3\n");

    if (overridable)
      write(dir / "driver_override", "(null)\n");

    fs::create_symlink(dir, busPath(bus) / "devices" / id);

    return dir;
  }

  void bind(const std::string &id, const std::string &driver,
            const std::string &bus = "pci") {
    fs::create_symlink(busPath(bus) / "drivers" / driver,
                       devicePath(bus, id) / "driver");
  }

  std::optional<std::string> driverOf(const std::string &id,
                                      const std::string &bus = "pci") const {
    auto link = devicePath(bus, id) / "driver";
    if (!fs::is_symlink(link))
      return std::nullopt;

    return fs::read_symlink(link).filename().string();
  }

  std::string overrideOf(const std::string &id,
                         const std::string &bus = "pci") const {
    return utils::read_from_file(devicePath(bus, id) / "driver_override")
        .value_or("");
  }

  Context context() const {
    Context ctx;

    ctx.sysfs = sysfs;
    ctx.persist_dir = persist;
    ctx.bus = "pci";

    return ctx;
  }
};

class SimulatedBus;

// Unbinding removes the driver link like the kernel does.
class SimulatedDriver : public kernel::devices::LinuxDriver {
public:
  SimulatedDriver(const fs::path &path) : LinuxDriver(path) {}

  void unbind(const kernel::devices::Device &device) const override {
    LinuxDriver::unbind(device);

    fs::remove(device.path() / "driver");
  }
};

// Probing binds the overriding driver, or the default driver if there is
// no override.
class SimulatedDevice : public kernel::devices::BusDevice {
protected:
  const SimulatedBus &sim;

public:
  SimulatedDevice(const SimulatedBus &bus, const fs::path &path);

  void probe() const override;
};

class SimulatedBus : public kernel::devices::Bus {
public:
  // Default driver of each device id
  std::map<std::string, std::string> defaults;

  // Drivers which can be loaded as modules
  std::set<std::string> modules;

  // Drivers which never accept a device
  std::set<std::string> refusing;

  mutable std::vector<std::string> loaded;

  SimulatedBus(const std::string &name, const fs::path &sysfs)
      : Bus(name, sysfs) {}

  void load_driver(const std::string &name) const override {
    if (!modules.count(name))
      throw ModuleLoadFailed(name);

    auto dir = drivers_path() / name;
    fs::create_directories(dir);
    SysfsFixture::write(dir / "unbind", "");
    SysfsFixture::write(dir / "new_id", "");

    loaded.push_back(name);
  }

  std::unique_ptr<kernel::devices::Driver>
  driver(const std::string &name) const override {
    return std::make_unique<SimulatedDriver>(drivers_path() / name);
  }

  std::unique_ptr<kernel::devices::Device>
  device(const fs::path &path) const override {
    return std::make_unique<SimulatedDevice>(*this, path);
  }
};

inline SimulatedDevice::SimulatedDevice(const SimulatedBus &bus,
                                        const fs::path &path)
    : BusDevice(bus, path), sim(bus) {}

inline void SimulatedDevice::probe() const {
  BusDevice::probe();

  if (driver())
    return;

  std::string target;

  auto value = override_value();
  if (value)
    target = *value;
  else {
    auto it = sim.defaults.find(name());
    if (it == sim.defaults.end())
      return;

    target = it->second;
  }

  if (!sim.has_driver(target) || sim.refusing.count(target))
    return;

  fs::create_symlink(sim.drivers_path() / target, path() / "driver");
}

// Executor whose buses all share one simulated kernel.
class SimulatedExecutor : public Executor {
protected:
  const SimulatedBus &sim;

  std::unique_ptr<kernel::devices::Bus>
  bus(const std::string &name) const override {
    auto b = std::make_unique<SimulatedBus>(name, ctx.sysfs);

    b->defaults = sim.defaults;
    b->modules = sim.modules;
    b->refusing = sim.refusing;

    return b;
  }

public:
  SimulatedExecutor(const Context &c, const SimulatedBus &s, std::ostream &o)
      : Executor(c, o), sim(s) {}
};

} // namespace test
} // namespace driverctl
