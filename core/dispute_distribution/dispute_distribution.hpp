/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "dispute_distribution/config.hpp"
#include "dispute_distribution/dispute_sender.hpp"

namespace tribune {
  class PoolHandler;
  class ThreadPool;
}  // namespace tribune

namespace tribune::crypto {
  class SessionKeys;
}

namespace tribune::network {
  class DisputeRequestSender;
}

namespace tribune::runtime {
  class ParachainHost;
}

namespace tribune::dispute {

  class DisputeSenderImpl;

  /**
   * Owns the sending side of dispute distribution: the pool running
   * response-wait tasks, the session information cache and the sender.
   * The sender itself is driven on `main_pool_handler`.
   */
  class DisputeDistribution {
   public:
    DisputeDistribution(
        const DisputeDistributionConfig &config,
        std::shared_ptr<runtime::ParachainHost> api,
        std::shared_ptr<crypto::SessionKeys> session_keys,
        std::shared_ptr<network::DisputeRequestSender> request_sender,
        std::shared_ptr<PoolHandler> main_pool_handler);

    ~DisputeDistribution();

    /// Starts the sender pool and subscribes the sender to task reports.
    void start();

    /// Stops accepting new response-wait tasks.
    void stop();

    std::shared_ptr<DisputeSender> sender() const;

   private:
    std::unique_ptr<ThreadPool> sender_pool_;
    std::shared_ptr<PoolHandler> sender_pool_handler_;
    std::shared_ptr<DisputeSenderImpl> sender_;
  };

}  // namespace tribune::dispute
