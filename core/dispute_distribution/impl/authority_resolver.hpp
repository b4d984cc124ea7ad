/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_set>

#include "dispute_distribution/runtime_info.hpp"

namespace tribune::dispute {

  /**
   * Determines all validators that should receive a given dispute request.
   *
   * This is all parachain validators of the session the candidate occurred
   * and all authorities of all currently active sessions, determined by
   * currently active heads. We are never among them.
   */
  class AuthorityResolver {
   public:
    explicit AuthorityResolver(std::shared_ptr<RuntimeInfo> runtime_info);

    /// Any session lookup failure fails the whole call.
    outcome::result<std::unordered_set<AuthorityDiscoveryId>>
    relevantAuthorities(const DisputeMessage &request,
                        const ActiveSessions &active_sessions) const;

   private:
    std::shared_ptr<RuntimeInfo> runtime_info_;
  };

}  // namespace tribune::dispute
