/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispute_distribution/runtime_info.hpp"

#include "common/lru_cache.hpp"
#include "dispute_distribution/config.hpp"

namespace tribune::runtime {
  class ParachainHost;
}

namespace tribune::crypto {
  class SessionKeys;
}

namespace tribune::dispute {

  /// Caching of session info.
  ///
  /// It should be ensured that a cached session stays live in the cache as long
  /// as we might need it.
  class RuntimeInfoImpl final : public RuntimeInfo {
   public:
    RuntimeInfoImpl(std::shared_ptr<runtime::ParachainHost> api,
                    std::shared_ptr<crypto::SessionKeys> session_keys,
                    const DisputeDistributionConfig &config);

    outcome::result<SessionIndex> get_session_index_for_child(
        const primitives::BlockHash &parent) override;

    outcome::result<ExtendedSessionInfo> get_session_info_by_index(
        const primitives::BlockHash &parent,
        SessionIndex session_index) override;

   private:
    /// Build `ValidatorInfo` for the current session.
    ValidatorInfo get_validator_info(const SessionInfo &session_info) const;

    std::shared_ptr<runtime::ParachainHost> api_;

    /// Key store for determining whether we are a validator and what
    /// `ValidatorIndex` we have.
    std::shared_ptr<crypto::SessionKeys> session_keys_;

    /// Get the session index for a given relay parent.
    ///
    /// We query this for every active head on every leaf update, so it is
    /// worth caching.
    LruCache<primitives::BlockHash, SessionIndex> session_index_cache_;

    /// Look up cached sessions by `SessionIndex`.
    LruCache<SessionIndex, ExtendedSessionInfo> session_info_cache_;
  };

}  // namespace tribune::dispute
