/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/dispute_sender_impl.hpp"

#include <utility>

#include "network/dispute_request_sender.hpp"
#include "utils/pool_handler.hpp"

namespace tribune::dispute {

  DisputeSenderImpl::DisputeSenderImpl(
      std::shared_ptr<RuntimeInfo> runtime_info,
      std::shared_ptr<utils::TaskSpawner> spawner,
      std::shared_ptr<network::DisputeRequestSender> request_sender,
      std::shared_ptr<PoolHandler> main_pool_handler)
      : log_(log::createLogger("DisputeSender", "dispute")),
        runtime_info_(std::move(runtime_info)),
        spawner_(std::move(spawner)),
        request_sender_(std::move(request_sender)),
        main_pool_handler_(std::move(main_pool_handler)),
        rx_(CompletionChannel::create().second) {
    BOOST_ASSERT(runtime_info_ != nullptr);
    BOOST_ASSERT(spawner_ != nullptr);
    BOOST_ASSERT(request_sender_ != nullptr);
    BOOST_ASSERT(main_pool_handler_ != nullptr);
  }

  void DisputeSenderImpl::start() {
    rx_.setOnMessage([wp{weak_from_this()}] {
      auto self = wp.lock();
      if (not self or not self->main_pool_handler_->isActive()) {
        return;
      }
      self->main_pool_handler_->execute([wp] {
        if (auto self = wp.lock()) {
          self->drainCompletions();
        }
      });
    });
  }

  outcome::result<void> DisputeSenderImpl::sendDispute(DisputeMessage request) {
    const auto &candidate_hash = request.candidate_hash;

    for (auto &[_candidate_hash, _] : sending_disputes_) {
      if (_candidate_hash == candidate_hash) {
        SL_TRACE(log_,
                 "Dispute (candidate={}) sending already active.",
                 candidate_hash);
        return outcome::success();
      }
    }

    SL_DEBUG(log_,
             "Start sending dispute (candidate={}, session={})",
             candidate_hash,
             request.session_index);

    OUTCOME_TRY(send_task,
                SendTask::create(log_,
                                 runtime_info_,
                                 spawner_,
                                 request_sender_,
                                 rx_.sender(),
                                 std::move(request),
                                 active_sessions_));

    sending_disputes_.emplace_back(candidate_hash, std::move(send_task));
    return outcome::success();
  }

  outcome::result<bool> DisputeSenderImpl::onActiveLeavesUpdate(
      const ActiveLeavesUpdate &update) {
    if (update.activated.has_value()) {
      active_heads_.emplace(update.activated->hash);
    }
    for (auto &leaf : update.deactivated) {
      active_heads_.erase(leaf);
    }

    OUTCOME_TRY(sessions_updated, refresh_sessions());
    if (sessions_updated) {
      have_new_sessions_ = true;
    }
    return sessions_updated;
  }

  outcome::result<bool> DisputeSenderImpl::refresh_sessions() {
    ActiveSessions new_sessions;

    // Iterate all heads we track as active and fetch the child' session
    // indices.
    for (auto &head : active_heads_) {
      OUTCOME_TRY(session_index,
                  runtime_info_->get_session_index_for_child(head));
      new_sessions.emplace(session_index, head);
    }

    auto sessions_updated = new_sessions.size() != active_sessions_.size();
    for (auto it = new_sessions.begin();
         not sessions_updated and it != new_sessions.end();
         ++it) {
      sessions_updated = not active_sessions_.contains(it->first);
    }

    // Update in any case, so we use current heads for queries:
    active_sessions_ = std::move(new_sessions);

    return sessions_updated;
  }

  void DisputeSenderImpl::onActiveDisputes(
      const std::unordered_set<CandidateHash> &candidates) {
    auto have_new_sessions = std::exchange(have_new_sessions_, false);

    // Cleanup obsolete senders
    sending_disputes_.remove_if([&](const auto &x) {
      const auto &candidate_hash = std::get<0>(x);
      return not candidates.contains(candidate_hash);
    });

    refresh_sendings([&](const SendTask &send_task) {
      return have_new_sessions or send_task.has_failed_sends();
    });
  }

  void DisputeSenderImpl::refreshFailedSends() {
    refresh_sendings(
        [](const SendTask &send_task) { return send_task.has_failed_sends(); });
  }

  template <typename Predicate>
  void DisputeSenderImpl::refresh_sendings(Predicate &&predicate) {
    // Iterates in order of insertion
    for (auto &[candidate_hash, send_task] : sending_disputes_) {
      if (not predicate(*send_task)) {
        continue;
      }
      auto res = send_task->refresh_sends(active_sessions_);
      if (res.has_error()) {
        SL_WARN(log_,
                "Refreshing dispute sending failed (candidate={}): {}",
                candidate_hash,
                res.error().message());
      }
    }
  }

  void DisputeSenderImpl::onTaskMessage(const FromSendingTask &message) {
    for (auto &[candidate_hash, send_task] : sending_disputes_) {
      if (candidate_hash == message.candidate_hash) {
        send_task->on_finished_send(message.authority, message.result);
        return;
      }
    }
    // Can happen when a dispute ends, with messages still in queue:
    SL_DEBUG(log_,
             "Received message for a no longer sent dispute "
             "(candidate={}, authority={}, result={})",
             message.candidate_hash,
             message.authority,
             message.result);
  }

  void DisputeSenderImpl::drainCompletions() {
    for (auto &message : rx_.drain()) {
      onTaskMessage(message);
    }
  }

}  // namespace tribune::dispute
