/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/channel.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::utils, ChannelError, e) {
  using E = tribune::utils::ChannelError;
  switch (e) {
    case E::RECEIVER_DROPPED:
      return "Receiving half of the channel was dropped";
  }
  return "unknown error (invalid ChannelError)";
}
