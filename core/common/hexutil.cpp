/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(tribune::common, UnhexError, e) {
  using tribune::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::MISSING_0X_PREFIX:
      return "Missing expected 0x prefix";
    case UnhexError::UNKNOWN:
      return "Unknown error";
  }
  return "Unknown error (error id not listed)";
}

namespace tribune::common {

  std::string hex_lower(std::span<const uint8_t> bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower_0x(std::span<const uint8_t> bytes) {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> blob;
    blob.reserve((hex.size() + 1) / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;

    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &) {
      return UnhexError::UNKNOWN;
    }
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(
      std::string_view hex_with_prefix) {
    constexpr std::string_view prefix = "0x";
    if (not hex_with_prefix.starts_with(prefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex_with_prefix.substr(prefix.size()));
  }

}  // namespace tribune::common
