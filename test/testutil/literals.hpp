/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "common/blob.hpp"
#include "primitives/authority_discovery_id.hpp"

inline tribune::common::Hash256 operator""_hash256(const char *c, size_t s) {
  tribune::common::Hash256 hash{};
  std::copy_n(c, std::min<size_t>(s, 32), hash.rbegin());
  return hash;
}

inline tribune::primitives::AuthorityDiscoveryId operator""_authority(
    const char *c, size_t s) {
  tribune::primitives::AuthorityDiscoveryId id{};
  std::copy_n(c, std::min<size_t>(s, 32), id.rbegin());
  return id;
}
