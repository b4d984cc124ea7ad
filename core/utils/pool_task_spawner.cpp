/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/pool_task_spawner.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::utils, SpawnError, e) {
  using E = tribune::utils::SpawnError;
  switch (e) {
    case E::POOL_STOPPED:
      return "Thread pool does not accept new tasks";
  }
  return "unknown error (invalid SpawnError)";
}

namespace tribune::utils {

  PoolTaskSpawner::PoolTaskSpawner(std::shared_ptr<PoolHandler> handler)
      : log_(log::createLogger("TaskSpawner", "threads")),
        handler_(std::move(handler)) {
    BOOST_ASSERT(handler_ != nullptr);
  }

  outcome::result<TaskHandle> PoolTaskSpawner::spawn(std::string_view label,
                                                     Task task) {
    if (not handler_->isActive()) {
      SL_WARN(log_, "Can't spawn task '{}': pool is stopped", label);
      return SpawnError::POOL_STOPPED;
    }

    auto state = std::make_shared<TaskState>();
    handler_->execute([log{log_},
                       label{std::string(label)},
                       state,
                       task{std::move(task)}] {
      if (state->isCancelled()) {
        SL_TRACE(log, "Task '{}' was cancelled before start", label);
        return;
      }
      task(state);
    });
    return TaskHandle{std::move(state)};
  }

}  // namespace tribune::utils
