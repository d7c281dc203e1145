/* PCI device classes usable as listing filters.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace driverctl {

enum class DeviceClass {
  ALL, // No filter
  STORAGE,
  NETWORK,
  DISPLAY,
  MULTIMEDIA,
  MEMORY,
  BRIDGE,
  COMMUNICATION,
  SYSTEM,
  INPUT,
  DOCKING,
  PROCESSOR,
  SERIAL
};

// All classes in table order, ALL first.
const std::vector<DeviceClass> &deviceClasses();

std::optional<DeviceClass> parseDeviceClass(const std::string &name);

std::string deviceClassName(DeviceClass cls);

// Two lower-case hex digits of the base class, std::nullopt for ALL.
std::optional<std::string> deviceClassCode(DeviceClass cls);

// Check a raw class attribute like "0x020000" against a class.
bool deviceClassMatches(DeviceClass cls, const std::string &classAttribute);

} // namespace driverctl
