/* Sysfs based Linux bus device.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <driverctl/fs.hpp>
#include <driverctl/kernel/devices/device.hpp>

namespace driverctl {
namespace kernel {
namespace devices {

class Bus;

class BusDevice : public Device {
private:
  static constexpr char OVERRIDE_DEFAULT[] = "driver_override";
  static constexpr char DRIVER_DEFAULT[] = "driver";

  // Reported by the kernel when no override is set.
  static constexpr char OVERRIDE_UNSET[] = "(null)";

protected:
  const Bus &m_bus;
  const fs::path m_path;
  const fs::path m_override_path;

  std::string attribute(const std::string &name) const;

public:
  BusDevice(const Bus &bus, const fs::path path)
      : BusDevice(bus, path, path / fs::path(OVERRIDE_DEFAULT)){};

  BusDevice(const Bus &bus, const fs::path path,
            const fs::path override_path)
      : m_bus(bus), m_path(path), m_override_path(override_path){};

  // Implement device interface
  std::optional<std::unique_ptr<Driver>> driver() const override;
  Id id() const override;
  std::string class_code() const override;
  std::string name() const override;
  bool overridable() const override;
  std::optional<std::string> override_value() const override;
  fs::path override_path() const override;
  fs::path path() const override;
  void probe() const override;
  void override(const std::string &driver) const override;
};

} // namespace devices
} // namespace kernel
} // namespace driverctl
