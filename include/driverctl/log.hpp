/* Logging.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <memory>
#include <string>

#include <jansson.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace driverctl {

using Logger = std::shared_ptr<spdlog::logger>;

class Log {

public:
  using Level = spdlog::level::level_enum;
  using DefaultSink = std::shared_ptr<spdlog::sinks::stderr_color_sink_mt>;
  using DistSink = std::shared_ptr<spdlog::sinks::dist_sink_mt>;
  using Formatter = std::shared_ptr<spdlog::pattern_formatter>;

  // Per-logger level override, e.g. { "name": "kernel", "level": "debug" }
  class Expression {
  public:
    std::string name;
    Level level;

    Expression(const std::string &n, Level lvl) : name(n), level(lvl) {}

    Expression(json_t *json);
  };

protected:
  DistSink sinks;
  DefaultSink sink;
  Formatter formatter;

  Level level;

  std::string pattern; // Logging format.
  std::string prefix;  // Prefix each line with this string.

  std::list<Expression> expressions;

  void apply(Logger logger) const;

public:
  Log(Level level = Level::warn);

  void parse(json_t *json);

  static Log &getInstance() {
    // Never destroyed, loggers are used until exit.
    static auto log = new Log();
    return *log;
  };

  Logger getNewLogger(const std::string &name);

  static Logger get(const std::string &name) {
    static auto &log = getInstance();
    return log.getNewLogger(name);
  }

  void setFormatter(const std::string &pattern, const std::string &pfx = "");
  void setLevel(Level lvl);
  void setLevel(const std::string &lvl);

  Level getLevel() const;

  void addSink(std::shared_ptr<spdlog::sinks::sink> sink) {
    // Levels are filtered per logger, sinks pass everything through.
    sink->set_formatter(formatter->clone());

    sinks->add_sink(sink);
  }
};

} // namespace driverctl
