/* Resolve user supplied device identifiers.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <driverctl/context.hpp>
#include <driverctl/fs.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

struct ResolvedDevice {
  std::string bus;
  std::string id;

  // Path below the sysfs mount root, e.g. /devices/pci0000:00/0000:00:1f.2
  std::string devpath;

  // Attribute directory of the device
  fs::path sysPath;

  // False if the device is gone. Only possible for lenient resolution.
  bool present = true;

  // Name of the persisted override record
  std::string key() const { return bus + "-" + id; }
};

/* Strip the sysfs mount root from a canonical device path.
 *
 * stripMountRoot("/sys/devices/pci0000:00/0000:00:1f.2", "/sys")
 * returns "/devices/pci0000:00/0000:00:1f.2". Throws RuntimeError if
 * path is not below root.
 */
std::string stripMountRoot(const fs::path &path, const fs::path &root);

class DeviceResolver {

protected:
  const Context &ctx;

  Logger logger;

  fs::path link(const std::string &bus, const std::string &id) const;

public:
  DeviceResolver(const Context &c)
      : ctx(c), logger(Log::get("resolver")) {}

  /* Resolve "[bus/]id" to a device.
   *
   * With mustExist == false a missing device is returned with
   * present == false instead of throwing DeviceNotFound.
   */
  ResolvedDevice resolve(const std::string &identifier,
                         bool mustExist = true) const;
};

} // namespace driverctl
