/* Commands of the driverctl tool.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <driverctl/device_class.hpp>

namespace driverctl {
namespace commands {

struct SetOverride {
  std::string device;
  std::string driver;
};

struct UnsetOverride {
  std::string device;
};

struct LoadOverride {
  std::string device;
};

struct GetDriver {
  std::string device;
};

struct ListDevices {
  DeviceClass cls = DeviceClass::ALL;
};

struct ListOverrides {
  DeviceClass cls = DeviceClass::ALL;
};

struct ListPersisted {};

} // namespace commands

using Command =
    std::variant<commands::SetOverride, commands::UnsetOverride,
                 commands::LoadOverride, commands::GetDriver,
                 commands::ListDevices, commands::ListOverrides,
                 commands::ListPersisted>;

// Parse the positional arguments (command name first). Throws UsageError.
Command parseCommand(const std::vector<std::string> &args);

} // namespace driverctl
