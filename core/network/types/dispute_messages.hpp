/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "parachain/types.hpp"

namespace tribune::network {

  using parachain::CandidateHash;
  using parachain::CandidateReceipt;
  using parachain::SessionIndex;
  using parachain::ValidatorIndex;
  using parachain::ValidatorSignature;

  /// Kinds of statements of validity of a candidate.
  enum class ValidDisputeStatementKind : uint8_t {
    /// An explicit statement issued as part of a dispute.
    Explicit,
    /// A seconded statement on a candidate from the backing phase.
    BackingSeconded,
    /// A valid statement on a candidate from the backing phase.
    BackingValid,
    /// An approval vote from the approval checking phase.
    ApprovalChecking,
  };

  /// Kinds of statements of invalidity (currently only explicit).
  enum class InvalidDisputeStatementKind : uint8_t {
    Explicit,
  };

  /// Any invalid vote (currently only explicit).
  struct InvalidDisputeVote {
    /// The voting validator index.
    ValidatorIndex index{};

    /// The validator signature, that can be verified when constructing a
    /// `SignedDisputeStatement`.
    ValidatorSignature signature;

    /// Kind of dispute statement.
    InvalidDisputeStatementKind kind{};

    bool operator==(const InvalidDisputeVote &) const = default;
  };

  /// Any valid vote (backing, approval, explicit).
  struct ValidDisputeVote {
    /// The voting validator index.
    ValidatorIndex index{};

    /// The validator signature, that can be verified when constructing a
    /// `SignedDisputeStatement`.
    ValidatorSignature signature;

    /// Kind of dispute statement.
    ValidDisputeStatementKind kind{};

    bool operator==(const ValidDisputeVote &) const = default;
  };

  /// A dispute initiating/participating message that have been built from
  /// signed statements.
  ///
  /// Immutable once built; copies are cheap enough to hand one to every
  /// outgoing request.
  struct DisputeMessage {
    /// Hash of `candidate_receipt`, computed by whoever built the message.
    CandidateHash candidate_hash;

    /// The candidate being disputed.
    CandidateReceipt candidate_receipt;

    /// The session the candidate appears in.
    SessionIndex session_index{};

    /// The invalid vote data that makes up this dispute.
    InvalidDisputeVote invalid_vote;

    /// The valid vote that makes this dispute request valid.
    ValidDisputeVote valid_vote;

    bool operator==(const DisputeMessage &) const = default;
  };

  /// Response of a peer to a `DisputeMessage`.
  enum class DisputeResponse : uint8_t {
    /// Recipient successfully processed the dispute request.
    Confirmed,
  };

}  // namespace tribune::network
