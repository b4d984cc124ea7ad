/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TRIBUNE_TEST_MOCK_CORE_DISPUTE_DISTRIBUTION_RUNTIME_INFO_MOCK_HPP
#define TRIBUNE_TEST_MOCK_CORE_DISPUTE_DISTRIBUTION_RUNTIME_INFO_MOCK_HPP

#include "dispute_distribution/runtime_info.hpp"

#include <gmock/gmock.h>

namespace tribune::dispute {
  class RuntimeInfoMock : public RuntimeInfo {
   public:
    ~RuntimeInfoMock() override = default;

    MOCK_METHOD(outcome::result<SessionIndex>,
                get_session_index_for_child,
                (const primitives::BlockHash &),
                (override));

    MOCK_METHOD(outcome::result<ExtendedSessionInfo>,
                get_session_info_by_index,
                (const primitives::BlockHash &, SessionIndex),
                (override));
  };
}  // namespace tribune::dispute

#endif  // TRIBUNE_TEST_MOCK_CORE_DISPUTE_DISTRIBUTION_RUNTIME_INFO_MOCK_HPP
