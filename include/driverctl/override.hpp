/* Driver override state machine.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <driverctl/kernel/devices/bus.hpp>
#include <driverctl/kernel/devices/device.hpp>
#include <driverctl/log.hpp>
#include <driverctl/persistence.hpp>

namespace driverctl {

enum class LoadStatus {
  APPLIED,
  NOT_PERSISTED // Nothing to do
};

/* Moves a device to a new driver.
 *
 * Each call of set() runs the complete sequence:
 *
 *   1. check that the device supports driver_override
 *   2. load the module of the new driver if necessary
 *   3. unbind the current driver
 *   4. register the device ID with the passthrough driver (errors ignored)
 *   5. write driver_override
 *   6. reprobe and verify that a driver got bound
 *
 * The steps are not transactional. A failure in 5 or 6 leaves the device
 * unbound.
 */
class OverrideController {

public:
  // Keeps the device unbound. No probe is triggered.
  static constexpr char NONE[] = "none";

protected:
  const kernel::devices::Bus &bus;
  const bool probe;

  Logger logger;

  void ensureDriver(const std::string &driver) const;

  void unbind(const kernel::devices::Device &device) const;

  void registerPassthrough(const kernel::devices::Device &device,
                           const std::string &driver) const;

  void writeOverride(const kernel::devices::Device &device,
                     const std::string &driver) const;

  void reprobe(const kernel::devices::Device &device,
               const std::string &driver) const;

public:
  OverrideController(const kernel::devices::Bus &b, bool p = true)
      : bus(b), probe(p), logger(Log::get("override")) {}

  // An empty driver clears the override.
  void set(const kernel::devices::Device &device,
           const std::string &driver) const;

  void unset(const kernel::devices::Device &device) const { set(device, ""); }

  // Re-apply the override persisted under key.
  LoadStatus load(const kernel::devices::Device &device,
                  const PersistenceStore &store, const std::string &key) const;
};

} // namespace driverctl
