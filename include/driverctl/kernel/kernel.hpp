/* Linux kernel related functions.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace driverctl {
namespace kernel {

// Module names use underscores where driver names often use dashes.
std::string moduleName(const std::string &driver);

/* Checks if a kernel module is loaded
 *
 * @param module the name of the module
 * @param modules list of loaded modules, /proc/modules by default
 * @retval 0 Module is loaded.
 * @retval <>0 Module is not loaded.
 */
int isModuleLoaded(const std::string &module,
                   const std::string &modules = "/proc/modules");

/* Load kernel module via modprobe
 *
 * @retval 0 modprobe succeeded.
 * @retval <>0 modprobe could not be started or failed.
 */
int loadModule(const std::string &module);

} // namespace kernel
} // namespace driverctl
