/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tribune::dispute {

  enum class SessionObtainingError {
    /// We tried fetching a session info which was not available.
    NoSuchSession = 1,
  };

}  // namespace tribune::dispute

OUTCOME_HPP_DECLARE_ERROR(tribune::dispute, SessionObtainingError);
