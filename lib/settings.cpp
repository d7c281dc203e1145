/* JSON configuration file.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <driverctl/config.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/settings.hpp>

using namespace driverctl;

std::optional<fs::path> Settings::locate(const std::string &explicitFile) {
  if (!explicitFile.empty())
    return fs::path(explicitFile);

  const char *env = getenv("DRIVERCTL_CONFIG");
  if (env && *env)
    return fs::path(env);

  if (fs::exists(DRIVERCTL_CONFIG_FILE))
    return fs::path(DRIVERCTL_CONFIG_FILE);

  return std::nullopt;
}

Context Settings::parse(json_t *json, Context ctx) const {
  const char *sysfs = nullptr;
  const char *persist_dir = nullptr;
  const char *bus = nullptr;
  int probe = -1;
  int save = -1;

  json_error_t err;
  json_t *json_logging = nullptr;

  int ret = json_unpack_ex(json, &err, JSON_STRICT,
                           "{ s?: s, s?: s, s?: s, s?: b, s?: b, s?: o }",
                           "sysfs", &sysfs, "persist_dir", &persist_dir, "bus",
                           &bus, "probe", &probe, "save", &save, "logging",
                           &json_logging);
  if (ret)
    throw ConfigError(err, "settings");

  if (sysfs)
    ctx.sysfs = sysfs;

  if (persist_dir)
    ctx.persist_dir = persist_dir;

  if (bus) {
    if (!*bus)
      throw ConfigError("bus", "The 'bus' setting must not be empty");

    ctx.bus = bus;
  }

  if (probe >= 0)
    ctx.probe = probe;

  if (save >= 0)
    ctx.save = save;

  if (json_logging)
    Log::getInstance().parse(json_logging);

  return ctx;
}

Context Settings::load(const fs::path &file, Context ctx) const {
  json_error_t err;

  logger->debug("Loading configuration from {}", file.string());

  json_t *json = json_load_file(file.c_str(), 0, &err);
  if (!json)
    throw ConfigError(err, file.string(), "Failed to load configuration");

  try {
    ctx = parse(json, ctx);
  } catch (...) {
    json_decref(json);
    throw;
  }

  json_decref(json);

  return ctx;
}
