/* Execute driverctl commands.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iostream>
#include <memory>

#include <driverctl/command.hpp>
#include <driverctl/context.hpp>
#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

class Executor {

protected:
  const Context &ctx;
  std::ostream &out;

  Logger logger;

  virtual std::unique_ptr<kernel::devices::Bus>
  bus(const std::string &name) const;

  int setOverride(const commands::SetOverride &cmd) const;
  int unsetOverride(const commands::UnsetOverride &cmd) const;
  int loadOverride(const commands::LoadOverride &cmd) const;
  int getDriver(const commands::GetDriver &cmd) const;
  int listDevices(DeviceClass cls, bool overridesOnly) const;
  int listPersisted(const commands::ListPersisted &cmd) const;

public:
  Executor(const Context &c, std::ostream &o = std::cout)
      : ctx(c), out(o), logger(Log::get("executor")) {}

  virtual ~Executor() {}

  // Returns the exit status. Handled failures are thrown.
  int execute(const Command &cmd) const;
};

} // namespace driverctl
