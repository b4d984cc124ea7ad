/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(tribune::log, Error, e) {
  using E = tribune::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_CONFIG:
      return "Logging system is not configured";
  }
  return "Unknown log::Error";
}

namespace tribune::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "tribune::log::setLoggingSystem() must be called first");
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 13> kLevelNames{{
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
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();
    outcome::result<void> res = outcome::success();

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      auto group = eq == std::string_view::npos ? std::string_view{kDefaultGroup}
                                                : chunk.substr(0, eq);
      auto level_name =
          eq == std::string_view::npos ? chunk : chunk.substr(eq + 1);

      auto level = str2lvl(level_name);
      if (level.has_error()) {
        res = level.as_failure();
        continue;
      }
      if (not logging_system->setLevelOfGroup(std::string{group},
                                              level.value())) {
        res = Error::WRONG_GROUP;
      }
    }
    return res;
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

  bool resetLevelOfGroup(const std::string &group_name) {
    return loggingSystem()->resetLevelOfGroup(group_name);
  }

}  // namespace tribune::log
