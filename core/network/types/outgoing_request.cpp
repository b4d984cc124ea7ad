/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/types/outgoing_request.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::network, RequestError, e) {
  using E = tribune::network::RequestError;
  switch (e) {
    case E::NOT_CONNECTED:
      return "Peer is not connected";
    case E::NETWORK_ERROR:
      return "Network error while performing request";
    case E::INVALID_RESPONSE:
      return "Response could not be decoded";
    case E::TIMEOUT:
      return "Request timed out";
  }
  return "unknown error (invalid RequestError)";
}
