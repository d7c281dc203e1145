/* Unit tests for configuration file and environment.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <criterion/criterion.h>
#include <jansson.h>

#include <driverctl/context.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/log.hpp>
#include <driverctl/settings.hpp>

#include "sysfs_fixture.hpp"

using namespace driverctl;
using driverctl::test::SysfsFixture;

// cppcheck-suppress unknownMacro
TestSuite(settings, .description = "Configuration");

Test(settings, defaults) {
  Context ctx;

  cr_assert_eq(ctx.sysfs, fs::path(DRIVERCTL_SYSFS_PATH));
  cr_assert_eq(ctx.persist_dir, fs::path(DRIVERCTL_PERSIST_DIR));
  cr_assert_eq(ctx.bus, "pci");
  cr_assert(ctx.probe);
  cr_assert(ctx.save);
  cr_assert_not(ctx.devpath.has_value());
}

Test(settings, parse) {
  json_error_t err;
  json_t *json = json_loads(R"({
    "sysfs": "/tmp/sys",
    "persist_dir": "/tmp/driverctl.d",
    "bus": "usb",
    "probe": false
  })",
                            0, &err);
  cr_assert_not_null(json);

  auto ctx = Settings().parse(json, Context());
  json_decref(json);

  cr_assert_eq(ctx.sysfs, fs::path("/tmp/sys"));
  cr_assert_eq(ctx.persist_dir, fs::path("/tmp/driverctl.d"));
  cr_assert_eq(ctx.bus, "usb");
  cr_assert_not(ctx.probe);
  cr_assert(ctx.save);
}

Test(settings, unknown_setting) {
  json_t *json = json_pack("{ s: s }", "subsystem", "pci");

  cr_assert_throw(Settings().parse(json, Context()), ConfigError);
  json_decref(json);
}

Test(settings, invalid_type) {
  json_t *json = json_pack("{ s: i }", "probe", 1);

  cr_assert_throw(Settings().parse(json, Context()), ConfigError);
  json_decref(json);
}

Test(settings, empty_bus) {
  json_t *json = json_pack("{ s: s }", "bus", "");

  cr_assert_throw(Settings().parse(json, Context()), ConfigError);
  json_decref(json);
}

Test(settings, logging) {
  json_t *json = json_pack("{ s: { s: s } }", "logging", "level", "debug");

  Settings().parse(json, Context());
  json_decref(json);

  cr_assert(Log::getInstance().getLevel() == Log::Level::debug);

  json = json_pack("{ s: { s: s } }", "logging", "level", "loud");

  cr_assert_throw(Settings().parse(json, Context()), ConfigError);
  json_decref(json);
}

Test(settings, load_file) {
  SysfsFixture fx;
  auto file = fx.base / "driverctl.json";

  SysfsFixture::write(file, "{ \"bus\": \"platform\", \"save\": false }\n");

  auto ctx = Settings().load(file, Context());

  cr_assert_eq(ctx.bus, "platform");
  cr_assert_not(ctx.save);
  cr_assert(ctx.probe);

  SysfsFixture::write(file, "{ \"bus\": \n");
  cr_assert_throw(Settings().load(file, Context()), ConfigError);

  cr_assert_throw(Settings().load(fx.base / "missing.json", Context()),
                  ConfigError);
}

Test(settings, locate) {
  cr_assert_eq(*Settings::locate("/etc/other.json"), fs::path("/etc/other.json"));

  setenv("DRIVERCTL_CONFIG", "/tmp/env.json", 1);
  cr_assert_eq(*Settings::locate(), fs::path("/tmp/env.json"));
  cr_assert_eq(*Settings::locate("/etc/other.json"), fs::path("/etc/other.json"));
  unsetenv("DRIVERCTL_CONFIG");
}

Test(settings, environment) {
  setenv("SUBSYSTEM", "usb", 1);
  setenv("DEVPATH", "/devices/pci0000:00/0000:00:14.0/usb1/1-1", 1);

  auto ctx = applyEnvironment(Context());

  cr_assert_eq(ctx.bus, "usb");
  cr_assert_eq(*ctx.devpath, "/devices/pci0000:00/0000:00:14.0/usb1/1-1");

  unsetenv("SUBSYSTEM");
  setenv("DEVPATH", "", 1);

  ctx = applyEnvironment(Context());

  cr_assert_eq(ctx.bus, "pci");
  cr_assert_not(ctx.devpath.has_value());
}
