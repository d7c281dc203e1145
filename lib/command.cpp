/* Commands of the driverctl tool.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <driverctl/command.hpp>
#include <driverctl/exceptions.hpp>

using namespace driverctl;
using namespace driverctl::commands;

static void checkArgs(const std::vector<std::string> &args, size_t min,
                      size_t max) {
  auto n = args.size() - 1;

  if (n < min || n > max)
    throw UsageError("Wrong number of arguments for {}", args[0]);
}

static DeviceClass parseClassArg(const std::vector<std::string> &args) {
  if (args.size() < 2)
    return DeviceClass::ALL;

  auto cls = parseDeviceClass(args[1]);
  if (!cls)
    throw UsageError("Unknown device class: {}", args[1]);

  return *cls;
}

Command driverctl::parseCommand(const std::vector<std::string> &args) {
  if (args.empty())
    throw UsageError("No command given");

  auto &cmd = args[0];

  if (cmd == "set-override") {
    checkArgs(args, 2, 2);
    if (args[2].empty())
      throw UsageError("Driver name must not be empty");

    return SetOverride{args[1], args[2]};
  } else if (cmd == "unset-override") {
    checkArgs(args, 1, 1);
    return UnsetOverride{args[1]};
  } else if (cmd == "load-override") {
    checkArgs(args, 1, 1);
    return LoadOverride{args[1]};
  } else if (cmd == "get-driver") {
    checkArgs(args, 1, 1);
    return GetDriver{args[1]};
  } else if (cmd == "list-devices") {
    checkArgs(args, 0, 1);
    return ListDevices{parseClassArg(args)};
  } else if (cmd == "list-overrides") {
    checkArgs(args, 0, 1);
    return ListOverrides{parseClassArg(args)};
  } else if (cmd == "list-persisted") {
    checkArgs(args, 0, 0);
    return ListPersisted{};
  }

  throw UsageError("Unknown command: {}", cmd);
}
