/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/types/dispute_messages.hpp"
#include "primitives/authority_discovery_id.hpp"
#include "utils/oneshot.hpp"

namespace tribune::network {

  /// What the transport does with a request for a peer it is not connected
  /// to.
  enum class IfDisconnected : uint8_t {
    /// Try to connect to the peer first.
    TryConnect,
    /// Fail the request right away.
    ImmediateError,
  };

  enum class RequestError {
    /// Peer could not be reached
    NOT_CONNECTED = 1,
    /// Sending or receiving failed on the wire
    NETWORK_ERROR,
    /// Peer answered with something we can't decode
    INVALID_RESPONSE,
    /// Peer did not answer in time
    TIMEOUT,
  };

  using OutgoingResult = outcome::result<DisputeResponse>;
  using ResponseSlot = utils::Oneshot<DisputeResponse>;

  /// Receiving end for the response to an `OutgoingRequest`.
  using PendingResponse = ResponseSlot::Receiver;

  /**
   * Dispute request addressed to an authority, ready to be handed to the
   * transport. The transport completes `pending_response` with the peer's
   * answer or with an error; dropping it unanswered fails the request with
   * `utils::OneshotError::CANCELED`.
   */
  struct OutgoingRequest {
    primitives::AuthorityDiscoveryId recipient;
    DisputeMessage payload;
    ResponseSlot::Sender pending_response;

    static std::pair<OutgoingRequest, PendingResponse> create(
        primitives::AuthorityDiscoveryId recipient, DisputeMessage payload) {
      auto [tx, rx] = ResponseSlot::create();
      return {OutgoingRequest{
                  std::move(recipient), std::move(payload), std::move(tx)},
              std::move(rx)};
    }
  };

}  // namespace tribune::network

OUTCOME_HPP_DECLARE_ERROR(tribune::network, RequestError);
