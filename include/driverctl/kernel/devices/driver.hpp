/* Interface for device drivers.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace driverctl {
namespace kernel {
namespace devices {

class Device;

class Driver {
public:
  virtual ~Driver(){};

  virtual std::string name() const = 0;
  virtual void unbind(const Device &device) const = 0;
  // Let the driver claim devices with the same vendor/device ID.
  virtual void add_id(const Device &device) const = 0;
};

} // namespace devices
} // namespace kernel
} // namespace driverctl
