/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/// Results of fallible tribune calls are `outcome::result<T>` carrying a
/// `std::error_code` built from one of the enum categories declared with
/// `OUTCOME_HPP_DECLARE_ERROR`.
namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome
