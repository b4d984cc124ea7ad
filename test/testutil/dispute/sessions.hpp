/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "dispute_distribution/runtime_info.hpp"
#include "testutil/literals.hpp"

namespace testutil {

  /**
   * Session with `discovery_keys`, of which the first `validators_count`
   * are parachain validators.
   */
  inline tribune::dispute::ExtendedSessionInfo makeSession(
      std::vector<tribune::primitives::AuthorityDiscoveryId> discovery_keys,
      size_t validators_count,
      std::optional<tribune::parachain::ValidatorIndex> our_index =
          std::nullopt) {
    tribune::dispute::ExtendedSessionInfo info;
    info.session_info.validators.resize(validators_count);
    info.session_info.discovery_keys = std::move(discovery_keys);
    info.validator_info.our_index = our_index;
    return info;
  }

  /// Dispute of candidate `candidate_hash` backed at `relay_parent`.
  inline tribune::network::DisputeMessage makeDispute(
      const tribune::parachain::CandidateHash &candidate_hash,
      const tribune::primitives::BlockHash &relay_parent,
      tribune::parachain::SessionIndex session_index) {
    tribune::network::DisputeMessage message;
    message.candidate_hash = candidate_hash;
    message.candidate_receipt.descriptor.relay_parent = relay_parent;
    message.session_index = session_index;
    message.invalid_vote.index = 1;
    message.valid_vote.index = 2;
    message.valid_vote.kind =
        tribune::network::ValidDisputeStatementKind::BackingValid;
    return message;
  }

}  // namespace testutil
