/* A Linux bus as exposed in /sys/bus.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <driverctl/exceptions.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/kernel/devices/bus_device.hpp>
#include <driverctl/kernel/devices/linux_driver.hpp>
#include <driverctl/kernel/kernel.hpp>
#include <driverctl/utils.hpp>

using namespace driverctl::kernel::devices;

fs::path Bus::path() const { return m_sysfs / "bus" / m_name; }

fs::path Bus::devices_path() const { return path() / "devices"; }

fs::path Bus::drivers_path() const { return path() / "drivers"; }

fs::path Bus::probe_path() const { return path() / "drivers_probe"; }

bool Bus::has_driver(const std::string &name) const {
  return fs::is_directory(drivers_path() / name);
}

void Bus::load_driver(const std::string &name) const {
  logger->info("Loading module for driver {}", name);

  if (kernel::loadModule(name))
    throw ModuleLoadFailed(name);

  if (!has_driver(name)) {
    logger->debug("Module {} loaded but no driver {} on bus {}",
                  kernel::moduleName(name), name, m_name);
    throw ModuleLoadFailed(name);
  }
}

std::unique_ptr<Driver> Bus::driver(const std::string &name) const {
  return std::make_unique<LinuxDriver>(drivers_path() / name);
}

std::unique_ptr<Device> Bus::device(const fs::path &path) const {
  return std::make_unique<BusDevice>(*this, path);
}

std::vector<std::unique_ptr<Device>> Bus::devices() const {
  std::vector<std::unique_ptr<Device>> devs;

  if (!fs::is_directory(devices_path()))
    return devs;

  for (auto &name : utils::read_names_in_directory(devices_path()))
    devs.push_back(device(devices_path() / name));

  return devs;
}
