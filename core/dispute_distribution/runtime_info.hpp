/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispute_distribution/types.hpp"
#include "outcome/outcome.hpp"

namespace tribune::dispute {

  /// Information about ourselves, in case we are an `Authority`.
  ///
  /// This data is derived from the `SessionInfo` and our key as found in the
  /// keystore.
  struct ValidatorInfo {
    /// The index this very validator has in `SessionInfo` vectors, if any.
    std::optional<ValidatorIndex> our_index;
    /// The group we belong to, if any.
    std::optional<GroupIndex> our_group;

    bool operator==(const ValidatorInfo &) const = default;
  };

  /// `SessionInfo` with additional useful data for validator nodes.
  struct ExtendedSessionInfo {
    /// Actual session info as fetched from the runtime.
    SessionInfo session_info;
    /// Contains useful information about ourselves, in case this node is a
    /// validator.
    ValidatorInfo validator_info;

    bool operator==(const ExtendedSessionInfo &) const = default;
  };

  /**
   * Session information lookup: who are the authorities of a session, as
   * seen from a given relay chain block, and which of them are we.
   */
  class RuntimeInfo {
   public:
    virtual ~RuntimeInfo() = default;

    /// Returns the session index expected at any child of the `parent` block.
    /// This does not return the session index for the `parent` block.
    virtual outcome::result<SessionIndex> get_session_index_for_child(
        const primitives::BlockHash &parent) = 0;

    /// Get `ExtendedSessionInfo` by session index.
    ///
    /// The runtime still needs a block to answer, so we take the parent in
    /// addition to the `SessionIndex`.
    virtual outcome::result<ExtendedSessionInfo> get_session_info_by_index(
        const primitives::BlockHash &parent, SessionIndex session_index) = 0;
  };

}  // namespace tribune::dispute
