/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace oppool::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    WRONG_FORMAT,
    CONFIGURATION_FAILED,
  };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"oppool"};

  /// Level of one group, parsed from `<level>` or `<group>=<level>`
  struct LevelOverride {
    std::string group;
    Level level;
  };

  outcome::result<LevelOverride> parseLevelOverride(std::string_view str);

  class LoggingSystem {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Applies level overrides in order.
     * Stops at the first malformed override or unknown group.
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &overrides);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

  /**
   * Logging system configured from soralog yaml.
   * Configurator messages are printed to stderr.
   */
  outcome::result<qtils::SharedRef<LoggingSystem>> createLoggingSystem(
      std::string_view yaml);

}  // namespace oppool::log

OUTCOME_HPP_DECLARE_ERROR(oppool::log, Error);
