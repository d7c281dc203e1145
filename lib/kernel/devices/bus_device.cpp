/* Sysfs based Linux bus device.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <driverctl/exceptions.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/kernel/devices/bus_device.hpp>
#include <driverctl/utils.hpp>

using driverctl::kernel::devices::BusDevice, driverctl::kernel::devices::Driver;
using driverctl::kernel::devices::Id;
using driverctl::utils::read_from_file;
using driverctl::utils::write_to_file;

std::string BusDevice::attribute(const std::string &name) const {
  auto value = read_from_file(m_path / name);
  if (!value)
    throw driverctl::SystemError("Failed to read {}", (m_path / name).string());

  return *value;
}

std::optional<std::unique_ptr<Driver>> BusDevice::driver() const {
  fs::path driver_symlink = this->m_path / fs::path(DRIVER_DEFAULT);

  if (!fs::is_symlink(driver_symlink))
    return std::nullopt;

  auto name = fs::read_symlink(driver_symlink).filename();
  return std::make_optional(m_bus.driver(name));
}

Id BusDevice::id() const {
  Id id;

  try {
    id.vendor = std::stoul(attribute("vendor"), nullptr, 16);
    id.device = std::stoul(attribute("device"), nullptr, 16);
  } catch (const std::logic_error &) {
    throw driverctl::RuntimeError("Failed to parse vendor/device ID of {}",
                                  name());
  }

  return id;
}

std::string BusDevice::class_code() const {
  return read_from_file(m_path / "class").value_or("");
}

std::string BusDevice::name() const { return this->m_path.filename(); }

bool BusDevice::overridable() const { return fs::exists(m_override_path); }

std::optional<std::string> BusDevice::override_value() const {
  auto value = read_from_file(m_override_path);
  if (!value || value->empty() || *value == OVERRIDE_UNSET)
    return std::nullopt;

  return value;
}

fs::path BusDevice::override_path() const { return this->m_override_path; }

fs::path BusDevice::path() const { return this->m_path; }

void BusDevice::probe() const { write_to_file(this->name(), m_bus.probe_path()); }

void BusDevice::override(const std::string &driver) const {
  // A lone newline is what clears the attribute, an empty write is a no-op.
  write_to_file(driver + "\n", this->m_override_path);
}
