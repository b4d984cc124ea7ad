/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/send_requests.hpp"

#include "dispute_distribution/impl/wait_response_task.hpp"
#include "network/dispute_request_sender.hpp"

namespace tribune::dispute {

  outcome::result<Deliveries> sendRequests(
      const log::Logger &log,
      utils::TaskSpawner &spawner,
      network::DisputeRequestSender &request_sender,
      const CompletionSender &tx,
      std::vector<AuthorityDiscoveryId> receivers,
      const DisputeMessage &request) {
    // Declared before `statuses`: on a failed spawn the handles must cancel
    // their tasks before the unsent requests are dropped.
    std::vector<network::OutgoingRequest> requests;
    requests.reserve(receivers.size());
    Deliveries statuses;
    statuses.reserve(receivers.size());

    for (auto &receiver : receivers) {
      auto [outgoing, pending_response] =
          network::OutgoingRequest::create(receiver, request);

      requests.emplace_back(std::move(outgoing));

      auto task = makeWaitResponseTask(
          log,
          std::make_shared<network::PendingResponse>(
              std::move(pending_response)),
          request.candidate_hash,
          receiver,
          tx);

      OUTCOME_TRY(handle, spawner.spawn(kDisputeSenderTaskLabel, task));
      statuses.emplace(std::move(receiver), Pending{std::move(handle)});
    }

    if (requests.empty()) {
      return statuses;
    }

    SL_TRACE(log,
             "Dispatching {} dispute requests (candidate={})",
             requests.size(),
             request.candidate_hash);

    // We should be connected, but if not - try to.
    request_sender.sendRequests(std::move(requests),
                                network::IfDisconnected::TryConnect);
    return statuses;
  }

}  // namespace tribune::dispute
