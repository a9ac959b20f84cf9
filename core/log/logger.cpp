/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>
#include <sstream>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(vigil::log, Error, e) {
  using E = vigil::log::Error;
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

namespace vigil::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "Logging system is not ready. "
                       "vigil::log::setLoggingSystem() must be called first");
      return logging_system;
    }
  }  // namespace

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

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  void tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();

    for (const auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        logging_system->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      std::istringstream iss(chunk);
      std::string group_name;
      std::string level_string;
      if (not std::getline(iss, group_name, '=')
          or not std::getline(iss, level_string)) {
        std::cerr << "Malformed log level setting: " << chunk << std::endl;
        continue;
      }
      if (not logging_system->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << std::endl;
        continue;
      }
      auto res = str2lvl(level_string);
      if (not res.has_value()) {
        std::cerr << "Invalid level: " << level_string << std::endl;
        continue;
      }
      logging_system->setLevelOfGroup(group_name, res.value());
    }
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    auto logging_system = loggingSystem();
    return std::static_pointer_cast<soralog::LoggerFactory>(logging_system)
        ->getLogger(tag, group);
  }

  Logger createLogger(const std::string &tag,
                      const std::string &group,
                      Level level) {
    auto logging_system = loggingSystem();
    return std::static_pointer_cast<soralog::LoggerFactory>(logging_system)
        ->getLogger(tag, group, level);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

  bool resetLevelOfGroup(const std::string &group_name) {
    return loggingSystem()->resetLevelOfGroup(group_name);
  }

  bool setLevelOfLogger(const std::string &logger_name, Level level) {
    return loggingSystem()->setLevelOfLogger(logger_name, level);
  }

  bool resetLevelOfLogger(const std::string &logger_name) {
    return loggingSystem()->resetLevelOfLogger(logger_name);
  }

}  // namespace vigil::log
