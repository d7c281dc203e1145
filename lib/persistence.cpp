/* Persisted driver overrides.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <driverctl/exceptions.hpp>
#include <driverctl/persistence.hpp>
#include <driverctl/utils.hpp>

using namespace driverctl;

void PersistenceStore::save(const std::string &key,
                            const std::string &driver) const {
  auto file = path(key);

  if (driver.empty()) {
    std::error_code ec;
    if (fs::remove(file, ec))
      logger->info("Removed persisted override {}", key);
    else if (ec)
      throw fs::filesystem_error("Failed to remove persisted override", file,
                                 ec);

    return;
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw fs::filesystem_error("Failed to create directory", dir, ec);

  std::ofstream f(file, std::ios::trunc);
  f << driver << std::endl;
  f.close();

  if (f.fail())
    throw SystemError("Failed to write {}", file.string());

  logger->info("Persisted override {} = {}", key, driver);
}

std::optional<std::string> PersistenceStore::load(const std::string &key) const {
  auto value = utils::read_from_file(path(key));
  if (!value || value->empty())
    return std::nullopt;

  return value;
}

std::vector<PersistedOverride>
PersistenceStore::list(const std::string &bus) const {
  std::vector<PersistedOverride> records;

  if (!fs::is_directory(dir))
    return records;

  auto prefix = bus + "-";

  for (auto &name : utils::read_names_in_directory(dir)) {
    if (name.compare(0, prefix.size(), prefix) != 0 ||
        name.size() == prefix.size())
      continue;

    auto driver = load(name);
    if (!driver)
      continue;

    records.push_back({name.substr(prefix.size()), *driver});
  }

  return records;
}
