/* Linux kernel related functions.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <driverctl/kernel/kernel.hpp>
#include <driverctl/log.hpp>

using namespace driverctl;

std::string driverctl::kernel::moduleName(const std::string &driver) {
  std::string module = driver;

  std::replace(module.begin(), module.end(), '-', '_');

  return module;
}

int driverctl::kernel::isModuleLoaded(const std::string &module,
                                      const std::string &modules) {
  std::ifstream f(modules);
  if (!f.is_open())
    return -1;

  auto name = moduleName(module);

  std::string line;
  while (std::getline(f, line)) {
    if (line.substr(0, line.find(' ')) == name)
      return 0;
  }

  return -1;
}

int driverctl::kernel::loadModule(const std::string &module) {
  auto logger = Log::get("kernel");

  if (!isModuleLoaded(module)) {
    logger->debug("Kernel module {} already loaded...", module);
    return 0;
  }

  logger->debug("Loading kernel module {}", module);

  pid_t pid = fork();
  switch (pid) {
  case -1: // Error
    return -1;

  case 0: // Child
    execlp("modprobe", "modprobe", "-q", module.c_str(), (char *)0);
    _exit(EXIT_FAILURE); // exec() never returns

  default:
    int status;
    if (waitpid(pid, &status, 0) < 0)
      return -1;

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
      logger->debug("modprobe {} failed with status {}", module, status);
      return -1;
    }

    return 0;
  }
}
