/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/send_task.hpp"

#include "dispute_distribution/impl/send_requests.hpp"
#include "network/dispute_request_sender.hpp"

namespace tribune::dispute {

  SendTask::SendTask(
      log::Logger log,
      std::shared_ptr<RuntimeInfo> runtime_info,
      std::shared_ptr<utils::TaskSpawner> spawner,
      std::shared_ptr<network::DisputeRequestSender> request_sender,
      CompletionSender tx,
      DisputeMessage request)
      : log_(std::move(log)),
        resolver_(std::move(runtime_info)),
        spawner_(std::move(spawner)),
        request_sender_(std::move(request_sender)),
        request_(std::move(request)),
        tx_(std::move(tx)) {
    BOOST_ASSERT(spawner_ != nullptr);
    BOOST_ASSERT(request_sender_ != nullptr);
  }

  outcome::result<std::unique_ptr<SendTask>> SendTask::create(
      log::Logger log,
      std::shared_ptr<RuntimeInfo> runtime_info,
      std::shared_ptr<utils::TaskSpawner> spawner,
      std::shared_ptr<network::DisputeRequestSender> request_sender,
      CompletionSender tx,
      DisputeMessage request,
      const ActiveSessions &active_sessions) {
    std::unique_ptr<SendTask> send_task(new SendTask(std::move(log),
                                                     std::move(runtime_info),
                                                     std::move(spawner),
                                                     std::move(request_sender),
                                                     std::move(tx),
                                                     std::move(request)));
    OUTCOME_TRY(send_task->refresh_sends(active_sessions));
    return send_task;
  }

  outcome::result<bool> SendTask::refresh_sends(
      const ActiveSessions &active_sessions) {
    OUTCOME_TRY(new_authorities,
                resolver_.relevantAuthorities(request_, active_sessions));

    // Note this will also contain all authorities for which sending failed
    // previously:
    std::vector<AuthorityDiscoveryId> add_authorities;
    for (const auto &authority : new_authorities) {
      if (not deliveries_.contains(authority)) {
        add_authorities.emplace_back(authority);
      }
    }

    // Get rid of dead/irrelevant tasks/statuses:
    SL_TRACE(log_, "Cleaning up deliveries (candidate={})", candidate_hash());
    std::erase_if(deliveries_, [&](const auto &delivery) {
      return not new_authorities.contains(delivery.first);
    });

    // Start any new tasks that are needed:
    SL_TRACE(log_,
             "Starting new send requests for authorities "
             "(candidate={}, new_and_failed_authorities={}, "
             "overall_authority_set_size={}, already_running_deliveries={})",
             candidate_hash(),
             add_authorities.size(),
             new_authorities.size(),
             deliveries_.size());

    auto sends_happened = not add_authorities.empty();

    OUTCOME_TRY(new_statuses,
                sendRequests(log_,
                             *spawner_,
                             *request_sender_,
                             tx_,
                             std::move(add_authorities),
                             request_));

    deliveries_.merge(new_statuses);
    has_failed_sends_ = false;
    return sends_happened;
  }

  void SendTask::on_finished_send(const AuthorityDiscoveryId &authority,
                                  TaskResult result) {
    switch (result) {
      case TaskResult::Failed:
        SL_WARN(log_,
                "Could not get our message out! If this keeps happening, "
                "then check chain whether the dispute made it there "
                "(candidate={}, authority={})",
                candidate_hash(),
                authority);
        has_failed_sends_ = true;
        // Remove state, so we know what to try again:
        deliveries_.erase(authority);
        break;

      case TaskResult::Succeeded: {
        auto it = deliveries_.find(authority);
        if (it == deliveries_.end()) {
          // Can happen when a sending became irrelevant while the response
          // was already queued.
          SL_DEBUG(log_,
                   "Received finished send for non existing task "
                   "(candidate={}, authority={}, result={})",
                   candidate_hash(),
                   authority,
                   result);
          return;
        }
        // We are done here:
        it->second = Succeeded{};
        break;
      }
    }
  }

}  // namespace tribune::dispute
