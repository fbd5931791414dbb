/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <iostream>
#include <utility>

#include <soralog/impl/configurator_from_yaml.hpp>
#include <yaml-cpp/yaml.h>

OUTCOME_CPP_DEFINE_CATEGORY(oppool::log, Error, e) {
  using E = oppool::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::WRONG_FORMAT:
      return "Expected <level> or <group>=<level>";
    case E::CONFIGURATION_FAILED:
      return "Can't configure logging system";
  }
  return "Unknown log::Error";
}

namespace oppool::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    static const std::array<std::pair<std::string_view, Level>, 14> kLevels{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
    for (auto &[name, level] : kLevels) {
      if (str == name) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<LevelOverride> parseLevelOverride(std::string_view str) {
    auto separator = str.find('=');
    if (separator == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(str));
      return LevelOverride{.group = defaultGroupName, .level = level};
    }
    auto group = str.substr(0, separator);
    if (group.empty()) {
      return Error::WRONG_FORMAT;
    }
    OUTCOME_TRY(level, str2lvl(str.substr(separator + 1)));
    return LevelOverride{.group = std::string{group}, .level = level};
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &overrides) {
    for (auto &str : overrides) {
      OUTCOME_TRY(level_override, parseLevelOverride(str));
      if (not logging_system_->setLevelOfGroup(level_override.group,
                                               level_override.level)) {
        return Error::WRONG_GROUP;
      }
    }
    return outcome::success();
  }

  outcome::result<qtils::SharedRef<LoggingSystem>> createLoggingSystem(
      std::string_view yaml) {
    YAML::Node config;
    try {
      config = YAML::Load(std::string{yaml});
    } catch (const YAML::Exception &e) {
      std::cerr << "Invalid logging config: " << e.what() << '\n';
      return Error::CONFIGURATION_FAILED;
    }

    auto configurator = std::make_shared<soralog::ConfiguratorFromYAML>(config);
    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(configurator));
    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      std::cerr << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return Error::CONFIGURATION_FAILED;
    }
    return std::make_shared<LoggingSystem>(std::move(logging_system));
  }

}  // namespace oppool::log
