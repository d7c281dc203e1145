/* Common entry point for command line tools.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <driverctl/colors.hpp>
#include <driverctl/config.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

class Tool {

protected:
  Logger logger;

  int argc;
  char **argv;

  std::string name;

  static void printCopyright();

  static void printVersion();

public:
  Tool(int ac, char *av[], const std::string &name);

  virtual ~Tool() {}

  virtual int main() { return 0; }

  virtual void usage() {}

  virtual void parse() {}

  // Runs parse() and main(). Errors are logged and turned into exit
  // status 1, a UsageError also prints the usage.
  virtual int run();
};

} // namespace driverctl
