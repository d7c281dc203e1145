/* Implementation of driver interface for Linux drivers.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fmt/core.h>

#include <driverctl/kernel/devices/device.hpp>
#include <driverctl/kernel/devices/linux_driver.hpp>
#include <driverctl/utils.hpp>

using driverctl::kernel::devices::Device, driverctl::kernel::devices::LinuxDriver;
using driverctl::utils::write_to_file;

void LinuxDriver::add_id(const Device &device) const {
  auto id = device.id();

  write_to_file(fmt::format("{:04x} {:04x}", id.vendor, id.device),
                this->new_id_path);
}

std::string LinuxDriver::name() const { return path.filename(); }

void LinuxDriver::unbind(const Device &device) const {
  write_to_file(device.name(), this->unbind_path);
}
