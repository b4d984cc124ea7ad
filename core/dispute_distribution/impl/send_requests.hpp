/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "dispute_distribution/types.hpp"
#include "log/logger.hpp"

namespace tribune::network {
  class DisputeRequestSender;
}

namespace tribune::dispute {

  /// Label of the tasks waiting for dispute responses.
  constexpr std::string_view kDisputeSenderTaskLabel = "dispute-sender";

  /**
   * Start sending of the given msg to all given authorities, and spawn tasks
   * for handling the responses.
   *
   * All requests go to the transport in one batch, asking it to connect to
   * disconnected peers. A spawn failure fails the whole batch: nothing is
   * sent and the tasks spawned so far are cancelled.
   *
   * @return `Pending` status for every receiver
   */
  outcome::result<Deliveries> sendRequests(
      const log::Logger &log,
      utils::TaskSpawner &spawner,
      network::DisputeRequestSender &request_sender,
      const CompletionSender &tx,
      std::vector<AuthorityDiscoveryId> receivers,
      const DisputeMessage &request);

}  // namespace tribune::dispute
