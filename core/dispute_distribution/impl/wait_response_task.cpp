/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/wait_response_task.hpp"

namespace tribune::dispute {

  TaskResult toTaskResult(const network::OutgoingResult &result) {
    if (result.has_value()
        and result.value() == network::DisputeResponse::Confirmed) {
      return TaskResult::Succeeded;
    }
    return TaskResult::Failed;
  }

  utils::Task makeWaitResponseTask(
      log::Logger log,
      std::shared_ptr<network::PendingResponse> pending_response,
      CandidateHash candidate_hash,
      AuthorityDiscoveryId receiver,
      CompletionSender tx) {
    return [log{std::move(log)},
            pending_response{std::move(pending_response)},
            candidate_hash,
            receiver{std::move(receiver)},
            tx{std::move(tx)}](std::shared_ptr<utils::TaskState> state) {
      // The callback keeps the pending response alive until the transport
      // completes it, or until cancellation closes it.
      state->onCancel(
          [weak_response{std::weak_ptr<network::PendingResponse>(
              pending_response)}] {
            if (auto response = weak_response.lock()) {
              response->close();
            }
          });
      pending_response->onReady([log,
                                 pending_response,
                                 candidate_hash,
                                 receiver,
                                 tx,
                                 state](network::OutgoingResult result) {
        if (state->isCancelled()) {
          SL_TRACE(log,
                   "Dropping response of abandoned dispute request "
                   "(candidate={}, receiver={})",
                   candidate_hash,
                   receiver);
          return;
        }

        auto task_result = toTaskResult(result);
        if (task_result == TaskResult::Failed) {
          SL_WARN(log,
                  "Error sending dispute statements to node "
                  "(candidate={}, receiver={}): {}",
                  candidate_hash,
                  receiver,
                  result.has_error() ? result.error().message()
                                     : std::string("unexpected response"));
        } else {
          SL_TRACE(log,
                   "Sending dispute message succeeded "
                   "(candidate={}, receiver={})",
                   candidate_hash,
                   receiver);
        }

        state->finish();
        auto res = tx.send(FromSendingTask{
            .candidate_hash = candidate_hash,
            .authority = receiver,
            .result = task_result,
        });
        if (res.has_error()) {
          SL_DEBUG(log,
                   "Failed to notify about dispute sending result: {}",
                   res.error().message());
        }
      });
    };
  }

}  // namespace tribune::dispute
