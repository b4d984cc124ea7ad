/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "network/types/outgoing_request.hpp"

namespace tribune::network {

  /**
   * Request/response transport for dispute messages.
   */
  class DisputeRequestSender {
   public:
    virtual ~DisputeRequestSender() = default;

    /**
     * Fire-and-forget submission of a batch of requests. Each response comes
     * back through the request's own `pending_response`.
     */
    virtual void sendRequests(std::vector<OutgoingRequest> requests,
                              IfDisconnected if_disconnected) = 0;
  };

}  // namespace tribune::network
