/* Inspect and override the driver bound to a device.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <getopt.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <driverctl/command.hpp>
#include <driverctl/context.hpp>
#include <driverctl/device_class.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/executor.hpp>
#include <driverctl/log.hpp>
#include <driverctl/settings.hpp>
#include <driverctl/tool.hpp>

namespace driverctl {
namespace tools {

class Driverctl : public Tool {

public:
  Driverctl(int argc, char *argv[]) : Tool(argc, argv, "driverctl") {}

protected:
  std::string configFile;
  std::string bus;

  bool noprobe = false;
  bool nosave = false;
  bool verbose = false;
  bool debug = false;

  std::optional<Command> command;

  void usage() {
    std::cout
        << "Usage: driverctl [OPTIONS] COMMAND" << std::endl
        << "  COMMAND is one of the following commands:" << std::endl
        << "    set-override DEVICE DRIVER  bind DEVICE to DRIVER" << std::endl
        << "                                ('none' keeps it unbound)"
        << std::endl
        << "    unset-override DEVICE       restore the default driver"
        << std::endl
        << "    load-override DEVICE        apply the persisted override"
        << std::endl
        << "    get-driver DEVICE           show the bound driver" << std::endl
        << "    list-devices [CLASS]        list overridable devices"
        << std::endl
        << "    list-overrides [CLASS]      list devices with an override"
        << std::endl
        << "    list-persisted              list persisted overrides"
        << std::endl
        << std::endl
        << "  DEVICE is a device name like 0000:03:00.0, optionally"
        << std::endl
        << "         prefixed with a bus, e.g. pci/03:00.0" << std::endl
        << std::endl
        << "  CLASS is one of:";
    for (auto cls : deviceClasses())
      std::cout << " " << deviceClassName(cls);
    std::cout << std::endl
              << std::endl
              << "  OPTIONS is one or more of the following options:"
              << std::endl
              << "    -b, --bus BUS      operate on BUS (default: $SUBSYSTEM "
                 "or " DRIVERCTL_DEFAULT_BUS ")"
              << std::endl
              << "    -c, --config FILE  read settings from FILE" << std::endl
              << "        --noprobe      do not reprobe after the override"
              << std::endl
              << "        --nosave       do not persist the override"
              << std::endl
              << "    -v, --verbose      show what is being done" << std::endl
              << "    -d, --debug        show debugging output" << std::endl
              << "    -h, --help         show this usage information"
              << std::endl
              << "    -V, --version      show the version of the tool"
              << std::endl
              << std::endl;

    printCopyright();
  }

  void parse() {
    enum { OPT_NOPROBE = 256, OPT_NOSAVE };

    static const struct option longOptions[] = {
        {"bus", required_argument, nullptr, 'b'},
        {"config", required_argument, nullptr, 'c'},
        {"noprobe", no_argument, nullptr, OPT_NOPROBE},
        {"nosave", no_argument, nullptr, OPT_NOSAVE},
        {"verbose", no_argument, nullptr, 'v'},
        {"debug", no_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}};

    // Parse optional command line arguments
    int c;
    while ((c = getopt_long(argc, argv, "+b:c:vdhV", longOptions, nullptr)) !=
           -1) {
      switch (c) {
      case 'b':
        bus = optarg;
        if (bus.empty())
          throw UsageError("Bus must not be empty");
        break;

      case 'c':
        configFile = optarg;
        break;

      case OPT_NOPROBE:
        noprobe = true;
        break;

      case OPT_NOSAVE:
        nosave = true;
        break;

      case 'v':
        verbose = true;
        break;

      case 'd':
        debug = true;
        break;

      case 'V':
        printVersion();
        exit(EXIT_SUCCESS);

      case 'h':
      case '?':
        usage();
        exit(c == '?' ? EXIT_FAILURE : EXIT_SUCCESS);
      }
    }

    applyLogLevel();

    command = parseCommand(std::vector<std::string>(argv + optind, argv + argc));
  }

  void applyLogLevel() {
    if (debug)
      Log::getInstance().setLevel(Log::Level::debug);
    else if (verbose)
      Log::getInstance().setLevel(Log::Level::info);
  }

  // Defaults < configuration file < environment < command line
  Context buildContext() {
    Context ctx;

    auto file = Settings::locate(configFile);
    if (file) {
      ctx = Settings().load(*file, ctx);

      // The configuration may have changed the level
      applyLogLevel();
    }

    ctx = applyEnvironment(ctx);

    if (!bus.empty())
      ctx.bus = bus;

    if (noprobe)
      ctx.probe = false;

    if (nosave)
      ctx.save = false;

    return ctx;
  }

  int main() {
    const Context ctx = buildContext();

    logger->debug("Operating on bus {} in {}", ctx.bus, ctx.sysfs.string());

    return Executor(ctx).execute(*command);
  }
};

} // namespace tools
} // namespace driverctl

int main(int argc, char *argv[]) {
  driverctl::tools::Driverctl t(argc, argv);

  return t.run();
}
