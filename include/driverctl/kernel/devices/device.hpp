/* Interface for Linux bus devices.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <driverctl/fs.hpp>
#include <driverctl/kernel/devices/driver.hpp>

namespace driverctl {
namespace kernel {
namespace devices {

// Vendor and device ID as found in the sysfs 'vendor' and 'device' files.
struct Id {
  unsigned int vendor = 0;
  unsigned int device = 0;
};

class Device {
public:
  virtual ~Device(){};

  // Currently bound driver, std::nullopt if unbound.
  virtual std::optional<std::unique_ptr<Driver>> driver() const = 0;
  virtual Id id() const = 0;
  // Raw class code, e.g. "0x020000".
  virtual std::string class_code() const = 0;
  virtual std::string name() const = 0;
  virtual bool overridable() const = 0;
  // Current override, std::nullopt if none is set.
  virtual std::optional<std::string> override_value() const = 0;
  virtual fs::path override_path() const = 0;
  virtual fs::path path() const = 0;
  virtual void probe() const = 0;
  // An empty driver name clears the override.
  virtual void override(const std::string &driver) const = 0;
};

} // namespace devices
} // namespace kernel
} // namespace driverctl
