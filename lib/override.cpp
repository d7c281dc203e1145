/* Driver override state machine.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <system_error>

#include <driverctl/config.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/override.hpp>

using namespace driverctl;
using driverctl::kernel::devices::Device;

void OverrideController::ensureDriver(const std::string &driver) const {
  if (driver.empty() || driver == NONE)
    return;

  if (bus.has_driver(driver))
    return;

  bus.load_driver(driver);
}

void OverrideController::unbind(const Device &device) const {
  auto current = device.driver();
  if (!current)
    return;

  auto &drv = *current;

  logger->info("Unbinding {} from {}", device.name(), drv->name());

  try {
    drv->unbind(device);
  } catch (const std::system_error &e) {
    throw UnbindFailed(device.name(), drv->name(), e.what());
  }
}

void OverrideController::registerPassthrough(const Device &device,
                                             const std::string &driver) const {
  if (driver != DRIVERCTL_PASSTHROUGH_DRIVER)
    return;

  // Fails if the ID is already known to the driver.
  try {
    bus.driver(driver)->add_id(device);
  } catch (const std::runtime_error &e) {
    logger->debug("Ignoring failed ID registration with {}: {}", driver,
                  e.what());
  }
}

void OverrideController::writeOverride(const Device &device,
                                       const std::string &driver) const {
  if (driver.empty())
    logger->info("Clearing driver override of {}", device.name());
  else
    logger->info("Setting driver override of {} to {}", device.name(),
                 driver);

  try {
    device.override(driver);
  } catch (const std::system_error &e) {
    throw OverrideWriteFailed(device.name(), e.what());
  }
}

void OverrideController::reprobe(const Device &device,
                                 const std::string &driver) const {
  if (driver == NONE || !probe)
    return;

  logger->info("Probing {}", device.name());

  // The verification below is authoritative, the kernel also rejects
  // the probe when no driver matches.
  try {
    device.probe();
  } catch (const std::system_error &e) {
    logger->debug("Probe of {} failed: {}", device.name(), e.what());
  }

  auto bound = device.driver();
  if (!bound)
    throw BindVerificationFailed(device.name(),
                                 driver.empty() ? "(default)" : driver);

  logger->info("Device {} is bound to {}", device.name(), (*bound)->name());
}

void OverrideController::set(const Device &device,
                             const std::string &driver) const {
  if (!device.overridable())
    throw UnsupportedDevice(device.name());

  ensureDriver(driver);
  unbind(device);
  registerPassthrough(device, driver);
  writeOverride(device, driver);
  reprobe(device, driver);
}

LoadStatus OverrideController::load(const Device &device,
                                    const PersistenceStore &store,
                                    const std::string &key) const {
  auto driver = store.load(key);
  if (!driver) {
    logger->debug("No override persisted for {}", key);
    return LoadStatus::NOT_PERSISTED;
  }

  logger->info("Loading persisted override {} for {}", *driver, key);

  set(device, *driver);

  return LoadStatus::APPLIED;
}
