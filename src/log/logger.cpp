/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(rollnode::log, Error, e) {
  using E = rollnode::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
  }
  return "Unknown log::Error";
}

namespace rollnode::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        std::ignore =
            logging_system_->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      std::istringstream iss(chunk);

      std::string group_name;
      if (not std::getline(iss, group_name, '=')) {
        std::cerr << "Can't read group in '" << chunk << "'\n";
        continue;
      }
      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << '\n';
        continue;
      }

      std::string level_string;
      if (not std::getline(iss, level_string)) {
        std::cerr << "Can't read level for group '" << group_name << "'\n";
        continue;
      }
      auto res = str2lvl(level_string);
      if (not res.has_value()) {
        std::cerr << "Invalid level: " << level_string << '\n';
        continue;
      }

      std::ignore = logging_system_->setLevelOfGroup(group_name, res.value());
    }
  }

}  // namespace rollnode::log
