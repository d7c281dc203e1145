/* List overridable devices of a bus.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <driverctl/device_class.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

struct DeviceListing {
  std::string id;
  std::optional<std::string> driver; // std::nullopt if unbound
  bool overridden = false;
};

class DeviceEnumerator {

protected:
  const kernel::devices::Bus &bus;

  Logger logger;

public:
  DeviceEnumerator(const kernel::devices::Bus &b)
      : bus(b), logger(Log::get("enumerator")) {}

  // Throws NoDevicesFound if nothing is left after filtering.
  std::vector<DeviceListing> enumerate(bool overridesOnly = false,
                                       DeviceClass cls = DeviceClass::ALL) const;
};

} // namespace driverctl
