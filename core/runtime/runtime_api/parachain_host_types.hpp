/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "parachain/types.hpp"
#include "primitives/authority_discovery_id.hpp"

namespace tribune::runtime {

  using parachain::SessionIndex;
  using parachain::ValidatorId;
  using parachain::ValidatorIndex;

  /// Information about validator sets of a session.
  struct SessionInfo {
    /// All the validators actively participating in parachain consensus.
    /// Indices are into the broader validator set.
    std::vector<ValidatorIndex> active_validator_indices;
    /// The amount of sessions to keep for disputes.
    SessionIndex dispute_period{};
    /// Validators in canonical ordering.
    ///
    /// NOTE: There might be more authorities in the current session, than
    /// `validators` participating in parachain consensus.
    std::vector<ValidatorId> validators;
    /// Validators' authority discovery keys for the session in canonical
    /// ordering.
    ///
    /// NOTE: The first `validators.size()` entries match the corresponding
    /// validators in `validators`, afterwards any remaining authorities can be
    /// found. This is any authorities not participating in parachain
    /// consensus.
    std::vector<primitives::AuthorityDiscoveryId> discovery_keys;
    /// Validators in shuffled ordering - these are the validator groups as
    /// produced by the `Scheduler` module for the session and are typically
    /// referred to by `GroupIndex`.
    std::vector<std::vector<ValidatorIndex>> validator_groups;

    bool operator==(const SessionInfo &) const = default;
  };

}  // namespace tribune::runtime
