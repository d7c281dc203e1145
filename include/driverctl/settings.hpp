/* JSON configuration file.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <jansson.h>

#include <driverctl/context.hpp>
#include <driverctl/fs.hpp>
#include <driverctl/log.hpp>

namespace driverctl {

class Settings {

protected:
  Logger logger;

public:
  Settings() : logger(Log::get("settings")) {}

  // Configuration file to use: the explicit one, $DRIVERCTL_CONFIG, or the
  // compiled-in default if it exists.
  static std::optional<fs::path> locate(const std::string &explicitFile = "");

  // Apply the settings in json on top of ctx.
  //
  // The optional "logging" object is handed to the global Log instance.
  // Throws ConfigError.
  Context parse(json_t *json, Context ctx) const;

  Context load(const fs::path &file, Context ctx) const;
};

} // namespace driverctl
