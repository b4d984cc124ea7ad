/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "parachain/types.hpp"

namespace tribune::crypto {

  /**
   * Knows which session keys belong to this node.
   */
  class SessionKeys {
   public:
    virtual ~SessionKeys() = default;

    /**
     * @return index of our parachain validator key in `validators`, none if
     * this node is not among them
     */
    virtual std::optional<parachain::ValidatorIndex> getParaValidatorIndex(
        const std::vector<parachain::ValidatorId> &validators) const = 0;
  };

  /**
   * Session keys of a node configured with (at most) one parachain validator
   * public key.
   */
  class SessionKeysImpl final : public SessionKeys {
   public:
    explicit SessionKeysImpl(std::optional<parachain::ValidatorId> para_key)
        : para_key_(std::move(para_key)) {}

    std::optional<parachain::ValidatorIndex> getParaValidatorIndex(
        const std::vector<parachain::ValidatorId> &validators) const override {
      if (not para_key_.has_value()) {
        return std::nullopt;
      }
      for (size_t i = 0; i < validators.size(); ++i) {
        if (validators[i] == *para_key_) {
          return static_cast<parachain::ValidatorIndex>(i);
        }
      }
      return std::nullopt;
    }

   private:
    std::optional<parachain::ValidatorId> para_key_;
  };

}  // namespace tribune::crypto
