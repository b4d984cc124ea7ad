/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>

namespace tribune::dispute {

  /**
   * Tunables of the dispute distribution sender.
   */
  struct DisputeDistributionConfig {
    /// How many `SessionInfo`s are kept by the session info cache.
    size_t session_info_cache_size = 10;

    /// How many relay parents are remembered with their child session index.
    size_t session_index_cache_size = 10;

    /// Threads running response-wait tasks.
    size_t sender_thread_count = 1;

    /// Name of the response-wait thread pool, used for thread names and logs.
    std::string sender_pool_tag = "dispute_sender";
  };

}  // namespace tribune::dispute
