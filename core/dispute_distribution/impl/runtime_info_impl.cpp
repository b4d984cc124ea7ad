/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/runtime_info_impl.hpp"

#include <algorithm>

#include "crypto/session_keys.hpp"
#include "dispute_distribution/impl/errors.hpp"
#include "runtime/runtime_api/parachain_host.hpp"

namespace tribune::dispute {

  RuntimeInfoImpl::RuntimeInfoImpl(
      std::shared_ptr<runtime::ParachainHost> api,
      std::shared_ptr<crypto::SessionKeys> session_keys,
      const DisputeDistributionConfig &config)
      : api_(std::move(api)),
        session_keys_(std::move(session_keys)),
        session_index_cache_(config.session_index_cache_size),
        session_info_cache_(config.session_info_cache_size) {
    BOOST_ASSERT(api_ != nullptr);
    BOOST_ASSERT(session_keys_ != nullptr);
  }

  outcome::result<SessionIndex> RuntimeInfoImpl::get_session_index_for_child(
      const primitives::BlockHash &parent) {
    if (auto cached = session_index_cache_.get(parent)) {
      return **cached;
    }
    OUTCOME_TRY(session_index, api_->session_index_for_child(parent));
    session_index_cache_.put(parent, session_index);
    return session_index;
  }

  outcome::result<ExtendedSessionInfo>
  RuntimeInfoImpl::get_session_info_by_index(
      const primitives::BlockHash &parent, SessionIndex session_index) {
    if (auto cached = session_info_cache_.get(session_index)) {
      return **cached;
    }

    OUTCOME_TRY(session_info_opt, api_->session_info(parent, session_index));
    if (not session_info_opt.has_value()) {
      return SessionObtainingError::NoSuchSession;
    }
    auto &session_info = session_info_opt.value();

    auto validator_info = get_validator_info(session_info);

    auto ext_session_info = session_info_cache_.put(
        session_index,
        ExtendedSessionInfo{std::move(session_info), validator_info});
    return *ext_session_info;
  }

  ValidatorInfo RuntimeInfoImpl::get_validator_info(
      const SessionInfo &session_info) const {
    auto our_index =
        session_keys_->getParaValidatorIndex(session_info.validators);
    if (not our_index.has_value()) {
      return ValidatorInfo{
          .our_index = std::nullopt,
          .our_group = std::nullopt,
      };
    }

    // Get our group index:
    const auto &groups = session_info.validator_groups;
    for (GroupIndex group_index = 0; group_index < groups.size();
         ++group_index) {
      const auto &group = groups[group_index];
      if (std::find(group.begin(), group.end(), *our_index) != group.end()) {
        return ValidatorInfo{
            .our_index = our_index,
            .our_group = group_index,
        };
      }
    }

    return ValidatorInfo{
        .our_index = our_index,
        .our_group = std::nullopt,
    };
  }

}  // namespace tribune::dispute
