/* Settings of a single driverctl invocation.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <driverctl/context.hpp>

using namespace driverctl;

Context driverctl::applyEnvironment(Context ctx) {
  const char *subsystem = getenv("SUBSYSTEM");
  if (subsystem && *subsystem)
    ctx.bus = subsystem;

  const char *devpath = getenv("DEVPATH");
  if (devpath && *devpath)
    ctx.devpath = devpath;

  return ctx;
}
