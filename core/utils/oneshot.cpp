/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/oneshot.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::utils, OneshotError, e) {
  using E = tribune::utils::OneshotError;
  switch (e) {
    case E::CANCELED:
      return "Sender was dropped before providing a value";
    case E::RECEIVER_DROPPED:
      return "Receiver was dropped";
    case E::ALREADY_SENT:
      return "Value was already sent";
  }
  return "unknown error (invalid OneshotError)";
}
