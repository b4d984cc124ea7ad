/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "network/types/dispute_messages.hpp"
#include "primitives/authority_discovery_id.hpp"
#include "primitives/common.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"
#include "utils/channel.hpp"
#include "utils/task_spawner.hpp"

namespace tribune::dispute {

  using network::DisputeMessage;
  using parachain::CandidateHash;
  using parachain::GroupIndex;
  using parachain::SessionIndex;
  using parachain::ValidatorId;
  using parachain::ValidatorIndex;
  using primitives::AuthorityDiscoveryId;
  using runtime::SessionInfo;

  /// Currently active sessions, each with the head to look it up at.
  using ActiveSessions =
      std::unordered_map<SessionIndex, primitives::BlockHash>;

  /// Outcome of a single attempt to deliver a dispute to an authority.
  enum class TaskResult : uint8_t {
    /// Task succeeded in getting the request to its peer.
    Succeeded,
    /// Task was not able to get the request out to its peer.
    ///
    /// It should be retried in that case.
    Failed,
  };

  /// Delivery of statements for given candidate finished for this authority.
  struct FromSendingTask {
    CandidateHash candidate_hash;
    AuthorityDiscoveryId authority;
    TaskResult result;
  };

  using CompletionChannel = utils::Channel<FromSendingTask>;
  using CompletionSender = CompletionChannel::Sender;
  using CompletionReceiver = CompletionChannel::Receiver;

  /// Request is still in flight. Dropping the handle abandons the attempt.
  struct Pending {
    utils::TaskHandle handle;
  };

  /// Succeeded - no need to send request to this peer anymore.
  struct Succeeded {};

  /// Status of a particular vote/statement delivery to a particular validator
  using DeliveryStatus = std::variant<Pending, Succeeded>;

  using Deliveries = std::unordered_map<AuthorityDiscoveryId, DeliveryStatus>;

  /// Activated leaf.
  struct ActivatedLeaf {
    /// The block hash.
    primitives::BlockHash hash;

    /// The block number.
    primitives::BlockNumber number{};
  };

  /// Changes in the set of active leaves: the relay chain heads which we care
  /// to work on.
  ///
  /// Note that the activated and deactivated fields indicate deltas, not
  /// complete sets.
  struct ActiveLeavesUpdate {
    /// New relay chain block of interest.
    std::optional<ActivatedLeaf> activated;

    /// Relay chain block hashes no longer of interest.
    std::vector<primitives::BlockHash> deactivated{};
  };

}  // namespace tribune::dispute

template <>
struct fmt::formatter<tribune::dispute::TaskResult>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(tribune::dispute::TaskResult result, FormatContext &ctx) const {
    using tribune::dispute::TaskResult;
    return fmt::formatter<std::string_view>::format(
        result == TaskResult::Succeeded ? "Succeeded" : "Failed", ctx);
  }
};
