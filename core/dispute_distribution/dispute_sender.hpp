/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_set>

#include "dispute_distribution/types.hpp"
#include "outcome/outcome.hpp"

namespace tribune::dispute {

  /**
   * Sends our own dispute votes to all relevant authorities and keeps them
   * up to date as sessions change.
   *
   * All methods must be called from the owning thread.
   */
  class DisputeSender {
   public:
    virtual ~DisputeSender() = default;

    /// Start sending the dispute, unless it is already being sent.
    virtual outcome::result<void> sendDispute(DisputeMessage request) = 0;

    /// Take care of a change in active leaves.
    ///
    /// Returns whether the set of active sessions changed.
    virtual outcome::result<bool> onActiveLeavesUpdate(
        const ActiveLeavesUpdate &update) = 0;

    /// Drop sendings of no longer active disputes, retry failed sends and
    /// reach authorities of new sessions.
    virtual void onActiveDisputes(
        const std::unordered_set<CandidateHash> &candidates) = 0;

    /// Retry sendings which had failures since their last refresh.
    virtual void refreshFailedSends() = 0;

    /// Handle a report of a finished sending task.
    virtual void onTaskMessage(const FromSendingTask &message) = 0;

    virtual const ActiveSessions &activeSessions() const = 0;

    /// Number of disputes currently being sent.
    virtual size_t sendingCount() const = 0;
  };

}  // namespace tribune::dispute
