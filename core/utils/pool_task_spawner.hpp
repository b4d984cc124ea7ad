/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "utils/task_spawner.hpp"

#include "log/logger.hpp"
#include "utils/pool_handler.hpp"

namespace tribune::utils {

  /**
   * Spawns tasks onto the thread pool behind a `PoolHandler`.
   */
  class PoolTaskSpawner final : public TaskSpawner {
   public:
    explicit PoolTaskSpawner(std::shared_ptr<PoolHandler> handler);

    outcome::result<TaskHandle> spawn(std::string_view label,
                                      Task task) override;

   private:
    log::Logger log_;
    std::shared_ptr<PoolHandler> handler_;
  };

}  // namespace tribune::utils
