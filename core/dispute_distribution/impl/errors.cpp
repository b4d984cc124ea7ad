/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::dispute, SessionObtainingError, e) {
  using E = tribune::dispute::SessionObtainingError;
  switch (e) {
    case E::NoSuchSession:
      return "Session info is not available";
  }
  return "unknown error (invalid SessionObtainingError)";
}
