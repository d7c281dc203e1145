/* Settings of a single driverctl invocation.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <driverctl/config.hpp>
#include <driverctl/fs.hpp>

namespace driverctl {

// Built once per invocation and passed by const reference to every
// component.
struct Context {
  fs::path sysfs = DRIVERCTL_SYSFS_PATH;
  fs::path persist_dir = DRIVERCTL_PERSIST_DIR;
  std::string bus = DRIVERCTL_DEFAULT_BUS;

  // Device path relative to sysfs, set by udev for hotplug events.
  std::optional<std::string> devpath;

  bool probe = true;
  bool save = true;
};

// Apply SUBSYSTEM (bus) and DEVPATH from the environment.
Context applyEnvironment(Context ctx);

} // namespace driverctl
