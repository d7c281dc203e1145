/* Common entry point for command line tools.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include <driverctl/tool.hpp>

using namespace driverctl;

void Tool::printCopyright() {
  std::cout << PROJECT_NAME " " << CLR_BLU(PROJECT_VERSION) << std::endl
            << " Copyright 2025 The driverctl Authors" << std::endl;
}

void Tool::printVersion() { std::cout << PROJECT_VERSION << std::endl; }

Tool::Tool(int ac, char *av[], const std::string &nme)
    : argc(ac), argv(av), name(nme) {
  logger = Log::get(name);
}

int Tool::run() {
  try {
    // Parse command line arguments
    parse();

    logger->debug("This is {} {}", PROJECT_NAME, PROJECT_VERSION);

    // Run tool
    return main();
  } catch (const UsageError &e) {
    logger->error("{}", e.what());
    usage();

    return EXIT_FAILURE;
  } catch (const std::runtime_error &e) {
    logger->error("{}", e.what());

    return EXIT_FAILURE;
  }
}
