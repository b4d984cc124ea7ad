/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispute_distribution/dispute_sender.hpp"

#include <list>
#include <memory>
#include <tuple>

#include "dispute_distribution/impl/send_task.hpp"
#include "log/logger.hpp"

namespace tribune {
  class PoolHandler;
}

namespace tribune::dispute {

  class DisputeSenderImpl final
      : public DisputeSender,
        public std::enable_shared_from_this<DisputeSenderImpl> {
   public:
    DisputeSenderImpl(
        std::shared_ptr<RuntimeInfo> runtime_info,
        std::shared_ptr<utils::TaskSpawner> spawner,
        std::shared_ptr<network::DisputeRequestSender> request_sender,
        std::shared_ptr<PoolHandler> main_pool_handler);

    /// Subscribes to task reports. `main_pool_handler` is expected to be
    /// started already.
    void start();

    outcome::result<void> sendDispute(DisputeMessage request) override;

    outcome::result<bool> onActiveLeavesUpdate(
        const ActiveLeavesUpdate &update) override;

    void onActiveDisputes(
        const std::unordered_set<CandidateHash> &candidates) override;

    void refreshFailedSends() override;

    void onTaskMessage(const FromSendingTask &message) override;

    const ActiveSessions &activeSessions() const override {
      return active_sessions_;
    }

    size_t sendingCount() const override {
      return sending_disputes_.size();
    }

    /// Feeds all queued task reports to `onTaskMessage`.
    void drainCompletions();

   private:
    /// Make active sessions correspond to currently active heads.
    ///
    /// Returns: true if sessions changed.
    outcome::result<bool> refresh_sessions();

    /// Refresh sendings matching `predicate`, in order of insertion.
    template <typename Predicate>
    void refresh_sendings(Predicate &&predicate);

    log::Logger log_;
    std::shared_ptr<RuntimeInfo> runtime_info_;
    std::shared_ptr<utils::TaskSpawner> spawner_;
    std::shared_ptr<network::DisputeRequestSender> request_sender_;
    std::shared_ptr<PoolHandler> main_pool_handler_;

    /// All heads we currently consider active.
    std::unordered_set<primitives::BlockHash> active_heads_;

    /// List of currently active sessions.
    ///
    /// Value is the hash that was used for the query.
    ActiveSessions active_sessions_;

    /// Sessions changed since the last handling of active disputes.
    bool have_new_sessions_ = false;

    /// All ongoing dispute sendings this subsystem is aware of.
    ///
    /// Using a list here instead of a map, as we want to iterate in the
    /// order of insertion.
    std::list<std::tuple<CandidateHash, std::unique_ptr<SendTask>>>
        sending_disputes_;

    /// Receiving end of the reports of sending tasks.
    CompletionReceiver rx_;
  };

}  // namespace tribune::dispute
