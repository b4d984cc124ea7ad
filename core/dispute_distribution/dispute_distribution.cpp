/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/dispute_distribution.hpp"

#include "dispute_distribution/impl/dispute_sender_impl.hpp"
#include "dispute_distribution/impl/runtime_info_impl.hpp"
#include "utils/pool_task_spawner.hpp"
#include "utils/thread_pool.hpp"

namespace tribune::dispute {

  DisputeDistribution::DisputeDistribution(
      const DisputeDistributionConfig &config,
      std::shared_ptr<runtime::ParachainHost> api,
      std::shared_ptr<crypto::SessionKeys> session_keys,
      std::shared_ptr<network::DisputeRequestSender> request_sender,
      std::shared_ptr<PoolHandler> main_pool_handler)
      : sender_pool_(std::make_unique<ThreadPool>(config.sender_pool_tag,
                                                  config.sender_thread_count)),
        sender_pool_handler_(sender_pool_->handler()),
        sender_(std::make_shared<DisputeSenderImpl>(
            std::make_shared<RuntimeInfoImpl>(
                std::move(api), std::move(session_keys), config),
            std::make_shared<utils::PoolTaskSpawner>(sender_pool_handler_),
            std::move(request_sender),
            std::move(main_pool_handler))) {}

  DisputeDistribution::~DisputeDistribution() {
    stop();
  }

  void DisputeDistribution::start() {
    sender_pool_handler_->start();
    sender_->start();
  }

  void DisputeDistribution::stop() {
    sender_pool_handler_->stop();
  }

  std::shared_ptr<DisputeSender> DisputeDistribution::sender() const {
    return sender_;
  }

}  // namespace tribune::dispute
