/* Common exceptions.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <jansson.h>

namespace driverctl {

class SystemError : public std::system_error {

public:
  SystemError(const std::string &what)
      : std::system_error(errno, std::system_category(), what) {}

  template <typename... Args>
  SystemError(const std::string &what, Args &&...args)
      : SystemError(fmt::format(what, std::forward<Args>(args)...)) {}
};

class RuntimeError : public std::runtime_error {

public:
  template <typename... Args>
  RuntimeError(const std::string &what, Args &&...args)
      : std::runtime_error(fmt::format(what, std::forward<Args>(args)...)) {}
};

class ConfigError : public std::runtime_error {

protected:
  // Name of the offending setting.
  std::string id;
  json_error_t error;

  std::string msg;

  std::string getMessage() const {
    std::stringstream ss;

    ss << std::runtime_error::what();

    if (!id.empty())
      ss << " (setting '" << id << "')";

    if (error.position >= 0)
      ss << ": " << error.text << " in " << error.source << ":" << error.line
         << ":" << error.column;

    return ss.str();
  }

public:
  ConfigError(const std::string &i,
              const std::string &what = "Failed to parse configuration")
      : std::runtime_error(what), id(i) {
    error.position = -1;

    msg = getMessage();
  }

  ConfigError(const json_error_t &e, const std::string &i,
              const std::string &what = "Failed to parse configuration")
      : std::runtime_error(what), id(i), error(e) {
    msg = getMessage();
  }

  const char *what() const noexcept override { return msg.c_str(); }
};

// Malformed command or arguments. The tool prints its usage on this one.
class UsageError : public RuntimeError {
public:
  using RuntimeError::RuntimeError;
};

class DeviceNotFound : public RuntimeError {
public:
  DeviceNotFound(const std::string &bus, const std::string &id)
      : RuntimeError("Device {} not found on bus {}", id, bus) {}
};

// The device does not expose a driver_override attribute.
class UnsupportedDevice : public RuntimeError {
public:
  UnsupportedDevice(const std::string &id)
      : RuntimeError("Device {} does not support driver override", id) {}
};

class ModuleLoadFailed : public RuntimeError {
public:
  ModuleLoadFailed(const std::string &driver)
      : RuntimeError("Failed to load driver {}", driver) {}
};

class UnbindFailed : public RuntimeError {
public:
  UnbindFailed(const std::string &id, const std::string &driver,
               const std::string &reason)
      : RuntimeError("Failed to unbind device {} from driver {}: {}", id,
                     driver, reason) {}
};

class OverrideWriteFailed : public RuntimeError {
public:
  OverrideWriteFailed(const std::string &id, const std::string &reason)
      : RuntimeError("Failed to write driver override of device {}: {}", id,
                     reason) {}
};

class BindVerificationFailed : public RuntimeError {
public:
  BindVerificationFailed(const std::string &id, const std::string &driver)
      : RuntimeError("Failed to bind device {} to driver {}", id, driver) {}
};

class NoDevicesFound : public RuntimeError {
public:
  NoDevicesFound(const std::string &bus)
      : RuntimeError("No overridable devices found on bus {}. Kernel too old?",
                     bus) {}
};

class NotBound : public RuntimeError {
public:
  NotBound(const std::string &id)
      : RuntimeError("Device {} is not bound to any driver", id) {}
};

} // namespace driverctl
