/* A Linux bus as exposed in /sys/bus.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <driverctl/config.hpp>
#include <driverctl/fs.hpp>
#include <driverctl/kernel/devices/device.hpp>
#include <driverctl/kernel/devices/driver.hpp>
#include <driverctl/log.hpp>

namespace driverctl {
namespace kernel {
namespace devices {

// Factory for the devices and drivers of one bus.
//
// All devices and drivers are created through the virtual methods of this
// class, so the whole kernel interaction can be replaced in one place.
class Bus {
protected:
  const std::string m_name;
  const fs::path m_sysfs;

  Logger logger;

public:
  Bus(const std::string &name, const fs::path &sysfs = DRIVERCTL_SYSFS_PATH)
      : m_name(name), m_sysfs(sysfs), logger(Log::get("kernel:bus")) {}

  virtual ~Bus() {}

  std::string name() const { return m_name; }

  fs::path sysfs() const { return m_sysfs; }

  // <sysfs>/bus/<name>
  fs::path path() const;

  fs::path devices_path() const;

  fs::path drivers_path() const;

  fs::path probe_path() const;

  bool has_driver(const std::string &name) const;

  // Load the module providing the driver. Throws ModuleLoadFailed.
  virtual void load_driver(const std::string &name) const;

  virtual std::unique_ptr<Driver> driver(const std::string &name) const;

  virtual std::unique_ptr<Device> device(const fs::path &path) const;

  // All devices on the bus, sorted by name.
  std::vector<std::unique_ptr<Device>> devices() const;
};

} // namespace devices
} // namespace kernel
} // namespace driverctl
