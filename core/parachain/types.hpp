/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"
#include "primitives/common.hpp"

TRIBUNE_BLOB_STRICT_TYPEDEF(tribune::parachain, ValidatorId, 32);
TRIBUNE_BLOB_STRICT_TYPEDEF(tribune::parachain, ValidatorSignature, 64);

namespace tribune::parachain {

  using CandidateHash = common::Hash256;
  using SessionIndex = uint32_t;
  using ValidatorIndex = uint32_t;
  using GroupIndex = uint32_t;
  using ParachainId = uint32_t;

  /// A unique descriptor of the candidate receipt.
  struct CandidateDescriptor {
    /// The ID of the para this is a candidate for.
    ParachainId para_id{};
    /// The hash of the relay-chain block this should be executed in the
    /// context of.
    primitives::BlockHash relay_parent;
    /// The blake2-256 hash of the pov-block.
    common::Hash256 pov_hash;
    /// Hash of the para header that is being generated by this candidate.
    common::Hash256 para_head_hash;
    /// The blake2-256 hash of the validation code bytes.
    common::Hash256 validation_code_hash;

    bool operator==(const CandidateDescriptor &) const = default;
  };

  /// A candidate-receipt.
  struct CandidateReceipt {
    /// The descriptor of the candidate.
    CandidateDescriptor descriptor;
    /// The hash of the encoded commitments made as a result of candidate
    /// execution.
    common::Hash256 commitments_hash;

    bool operator==(const CandidateReceipt &) const = default;
  };

}  // namespace tribune::parachain
