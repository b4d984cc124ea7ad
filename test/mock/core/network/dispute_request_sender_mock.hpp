/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TRIBUNE_TEST_MOCK_CORE_NETWORK_DISPUTE_REQUEST_SENDER_MOCK_HPP
#define TRIBUNE_TEST_MOCK_CORE_NETWORK_DISPUTE_REQUEST_SENDER_MOCK_HPP

#include "network/dispute_request_sender.hpp"

#include <gmock/gmock.h>

namespace tribune::network {
  class DisputeRequestSenderMock : public DisputeRequestSender {
   public:
    ~DisputeRequestSenderMock() override = default;

    MOCK_METHOD(void,
                sendRequests,
                (std::vector<OutgoingRequest>, IfDisconnected),
                (override));
  };
}  // namespace tribune::network

#endif  // TRIBUNE_TEST_MOCK_CORE_NETWORK_DISPUTE_REQUEST_SENDER_MOCK_HPP
