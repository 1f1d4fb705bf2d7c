/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::log, Error, e) {
  using E = dataworker::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace dataworker::log {

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
      : logging_system_(std::move(logging_system)) {
    BOOST_ASSERT(logging_system_ != nullptr);
  }

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (const auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        std::ignore =
            logging_system_->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      auto eq = chunk.find('=');
      if (eq == std::string::npos) {
        std::cerr << "Invalid logging filter '" << chunk
                  << "'; expected <group>=<level>\n";
        continue;
      }
      auto group_name = chunk.substr(0, eq);
      auto level_string = chunk.substr(eq + 1);

      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << '\n';
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

}  // namespace dataworker::log
