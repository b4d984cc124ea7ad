/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

// pre-include all formatters
#include "log/formatters/optional.hpp"

namespace tribune::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    WRONG_CONFIG,
  };

  /// Root group of the project loggers.
  inline const std::string kDefaultGroup = "tribune";

  outcome::result<Level> str2lvl(std::string_view str);

  /// Installs the logging system used by `createLogger`, for libp2p too.
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies chunks like `debug` (whole project) or `dispute=trace`.
   * Every valid chunk is applied; the error of the last invalid one is
   * returned.
   */
  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);
  bool resetLevelOfGroup(const std::string &group_name);

}  // namespace tribune::log

OUTCOME_HPP_DECLARE_ERROR(tribune::log, Error);
