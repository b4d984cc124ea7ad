/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/authority_resolver.hpp"

#include <algorithm>

namespace tribune::dispute {

  AuthorityResolver::AuthorityResolver(
      std::shared_ptr<RuntimeInfo> runtime_info)
      : runtime_info_(std::move(runtime_info)) {
    BOOST_ASSERT(runtime_info_ != nullptr);
  }

  outcome::result<std::unordered_set<AuthorityDiscoveryId>>
  AuthorityResolver::relevantAuthorities(
      const DisputeMessage &request,
      const ActiveSessions &active_sessions) const {
    std::unordered_set<AuthorityDiscoveryId> authorities;

    auto retrieve = [&](const primitives::BlockHash &head,
                        SessionIndex session_index,
                        bool validators_only) -> outcome::result<void> {
      OUTCOME_TRY(ext_session_info,
                  runtime_info_->get_session_info_by_index(head,
                                                           session_index));

      const auto &session_info = ext_session_info.session_info;
      const auto &our_index = ext_session_info.validator_info.our_index;

      auto count = session_info.discovery_keys.size();
      if (validators_only) {
        count = std::min(count, session_info.validators.size());
      }

      for (size_t index = 0; index < count; ++index) {
        if (our_index == index) {
          continue;
        }
        authorities.emplace(session_info.discovery_keys[index]);
      }
      return outcome::success();
    };

    // Retrieve all authorities which participated in the parachain consensus
    // of the session in which the candidate was backed.
    OUTCOME_TRY(retrieve(request.candidate_receipt.descriptor.relay_parent,
                         request.session_index,
                         true));

    // Retrieve all authorities for the current session as indicated by the
    // active heads we are tracking.
    for (const auto &[session_index, head] : active_sessions) {
      OUTCOME_TRY(retrieve(head, session_index, false));
    }

    return authorities;
  }

}  // namespace tribune::dispute
