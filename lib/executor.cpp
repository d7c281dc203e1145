/* Execute driverctl commands.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <driverctl/enumerator.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/executor.hpp>
#include <driverctl/override.hpp>
#include <driverctl/persistence.hpp>
#include <driverctl/resolver.hpp>
#include <driverctl/utils.hpp>

using namespace driverctl;
using namespace driverctl::commands;

std::unique_ptr<kernel::devices::Bus>
Executor::bus(const std::string &name) const {
  return std::make_unique<kernel::devices::Bus>(name, ctx.sysfs);
}

int Executor::setOverride(const SetOverride &cmd) const {
  auto dev = DeviceResolver(ctx).resolve(cmd.device);
  auto b = bus(dev.bus);
  auto device = b->device(dev.sysPath);

  OverrideController(*b, ctx.probe).set(*device, cmd.driver);

  if (ctx.save)
    PersistenceStore(ctx.persist_dir).save(dev.key(), cmd.driver);

  return EXIT_SUCCESS;
}

int Executor::unsetOverride(const UnsetOverride &cmd) const {
  auto dev = DeviceResolver(ctx).resolve(cmd.device, false);

  // Removed before the kernel transition, which may fail half way.
  if (ctx.save)
    PersistenceStore(ctx.persist_dir).save(dev.key(), "");

  if (dev.present) {
    auto b = bus(dev.bus);
    auto device = b->device(dev.sysPath);

    OverrideController(*b, ctx.probe).unset(*device);
  }

  return EXIT_SUCCESS;
}

int Executor::loadOverride(const LoadOverride &cmd) const {
  auto dev = DeviceResolver(ctx).resolve(cmd.device);
  auto b = bus(dev.bus);
  auto device = b->device(dev.sysPath);

  PersistenceStore store(ctx.persist_dir);

  auto status = OverrideController(*b, ctx.probe).load(*device, store, dev.key());

  return status == LoadStatus::APPLIED ? EXIT_SUCCESS : EXIT_FAILURE;
}

int Executor::getDriver(const GetDriver &cmd) const {
  auto dev = DeviceResolver(ctx).resolve(cmd.device);
  auto b = bus(dev.bus);
  auto device = b->device(dev.sysPath);

  auto drv = device->driver();
  if (!drv)
    throw NotBound(dev.id);

  out << (*drv)->name() << std::endl;

  return EXIT_SUCCESS;
}

int Executor::listDevices(DeviceClass cls, bool overridesOnly) const {
  auto b = bus(ctx.bus);

  for (auto &l : DeviceEnumerator(*b).enumerate(overridesOnly, cls)) {
    out << l.id << " " << l.driver.value_or("(none)");

    if (l.overridden && !overridesOnly)
      out << " [*]";

    out << std::endl;
  }

  return EXIT_SUCCESS;
}

int Executor::listPersisted(const ListPersisted &) const {
  for (auto &r : PersistenceStore(ctx.persist_dir).list(ctx.bus))
    out << r.id << " " << r.driver << std::endl;

  return EXIT_SUCCESS;
}

int Executor::execute(const Command &cmd) const {
  return std::visit(
      utils::overloaded{
          [this](const SetOverride &c) { return setOverride(c); },
          [this](const UnsetOverride &c) { return unsetOverride(c); },
          [this](const LoadOverride &c) { return loadOverride(c); },
          [this](const GetDriver &c) { return getDriver(c); },
          [this](const ListDevices &c) { return listDevices(c.cls, false); },
          [this](const ListOverrides &c) { return listDevices(c.cls, true); },
          [this](const ListPersisted &c) { return listPersisted(c); }},
      cmd);
}
