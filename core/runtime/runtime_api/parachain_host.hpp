/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace tribune::runtime {

  /**
   * Runtime API answering questions about sessions at a given relay chain
   * block.
   */
  class ParachainHost {
   public:
    virtual ~ParachainHost() = default;

    /**
     * @brief Returns the session index expected at a child of the block.
     * @return session index
     */
    virtual outcome::result<SessionIndex> session_index_for_child(
        const primitives::BlockHash &block) = 0;

    /**
     * @brief Get the session info for the given session, if stored.
     * @param index session index
     * @return SessionInfo, optional
     */
    virtual outcome::result<std::optional<SessionInfo>> session_info(
        const primitives::BlockHash &block, SessionIndex index) = 0;
  };

}  // namespace tribune::runtime
