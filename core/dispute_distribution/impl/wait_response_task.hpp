/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispute_distribution/types.hpp"
#include "log/logger.hpp"
#include "network/types/outgoing_request.hpp"

namespace tribune::dispute {

  /**
   * Maps the transport's answer to the outcome of a delivery attempt.
   */
  TaskResult toTaskResult(const network::OutgoingResult &result);

  /**
   * Builds the task waiting for the response to a single dispute request.
   *
   * Once the response (or an error) is there, a `FromSendingTask` with the
   * outcome is sent over `tx`. Nothing is reported when the task was
   * cancelled in the meantime; failure to report because the receiver is gone
   * is only logged. The task never retries.
   */
  utils::Task makeWaitResponseTask(
      log::Logger log,
      std::shared_ptr<network::PendingResponse> pending_response,
      CandidateHash candidate_hash,
      AuthorityDiscoveryId receiver,
      CompletionSender tx);

}  // namespace tribune::dispute
