/* Logging.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <driverctl/config.hpp>
#include <driverctl/exceptions.hpp>
#include <driverctl/log.hpp>

using namespace driverctl;

Log::Expression::Expression(json_t *json) {
  const char *nme;
  const char *lvl;

  json_error_t err;
  int ret = json_unpack_ex(json, &err, JSON_STRICT, "{ s: s, s: s }", "name",
                           &nme, "level", &lvl);
  if (ret)
    throw ConfigError(err, "logging.expressions");

  level = spdlog::level::from_str(lvl);
  if (level == Level::off && std::string(lvl) != "off")
    throw ConfigError("logging.expressions",
                      fmt::format("Invalid log level {}", lvl));

  name = nme;
}

Log::Log(Level lvl) : level(lvl), pattern("%H:%M:%S %^%-5l%$ %n: %v") {
  char *p = getenv("DRIVERCTL_LOG_PREFIX");
  if (p)
    prefix = p;

  sinks = std::make_shared<DistSink::element_type>();

  // Default sink
  sink = std::make_shared<DefaultSink::element_type>();
  sinks->add_sink(sink);

  setFormatter(pattern, prefix);
  setLevel(level);
}

void Log::apply(Logger logger) const {
  auto lvl = level;

  for (auto &expr : expressions) {
    if (expr.name == logger->name())
      lvl = expr.level;
  }

  logger->set_level(lvl);
}

Logger Log::getNewLogger(const std::string &name) {
  Logger logger = spdlog::get(name);

  if (not logger) {
    logger = std::make_shared<Logger::element_type>(name, sinks);

    apply(logger);
    spdlog::register_logger(logger);
  }

  return logger;
}

void Log::parse(json_t *json) {
  const char *lvl = nullptr;
  const char *path = nullptr;
  const char *pat = nullptr;

  int use_syslog = 0;
  int ret;

  json_error_t err;
  json_t *json_expressions = nullptr;

  ret = json_unpack_ex(json, &err, JSON_STRICT,
                       "{ s?: s, s?: s, s?: o, s?: b, s?: s }", "level", &lvl,
                       "file", &path, "expressions", &json_expressions,
                       "syslog", &use_syslog, "pattern", &pat);
  if (ret)
    throw ConfigError(err, "logging");

  if (json_expressions) {
    if (!json_is_array(json_expressions))
      throw ConfigError("logging.expressions",
                        "The 'expressions' setting must be a list of objects.");

    size_t i;
    json_t *json_expression;
    json_array_foreach(json_expressions, i, json_expression)
        expressions.emplace_back(json_expression);
  }

  if (lvl) {
    try {
      setLevel(lvl);
    } catch (const RuntimeError &e) {
      throw ConfigError("logging.level", e.what());
    }
  } else
    setLevel(level);

  if (pat)
    setFormatter(pat, prefix);

  if (path)
    addSink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));

  if (use_syslog)
    addSink(std::make_shared<spdlog::sinks::syslog_sink_mt>(
        PROJECT_NAME, LOG_PID, LOG_DAEMON, true));
}

void Log::setFormatter(const std::string &pat, const std::string &pfx) {
  pattern = pat;
  prefix = pfx;

  formatter = std::make_shared<spdlog::pattern_formatter>(
      prefix + pattern, spdlog::pattern_time_type::utc);

  sinks->set_formatter(formatter->clone());
}

void Log::setLevel(Level lvl) {
  level = lvl;

  sinks->set_level(Level::trace);

  spdlog::apply_all([this](Logger logger) { apply(logger); });
}

void Log::setLevel(const std::string &lvl) {
  auto l = spdlog::level::from_str(lvl);
  if (l == Level::off && lvl != "off")
    throw RuntimeError("Invalid log level {}", lvl);

  setLevel(l);
}

Log::Level Log::getLevel() const { return level; }
