/* Persisted driver overrides.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <driverctl/fs.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

struct PersistedOverride {
  std::string id;
  std::string driver;
};

// One file per device named "<bus>-<id>", containing the driver name.
class PersistenceStore {

protected:
  const fs::path dir;

  Logger logger;

public:
  PersistenceStore(const fs::path &d)
      : dir(d), logger(Log::get("persistence")) {}

  fs::path path(const std::string &key) const { return dir / key; }

  // Store driver for key. An empty driver removes the record.
  void save(const std::string &key, const std::string &driver) const;

  std::optional<std::string> load(const std::string &key) const;

  // All records of a bus, sorted by device id.
  std::vector<PersistedOverride> list(const std::string &bus) const;
};

} // namespace driverctl
