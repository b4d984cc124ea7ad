/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

#include <boost/assert.hpp>

namespace tribune {

  /**
   * Bounded cache evicting the least recently used entry. Entries are kept
   * ordered by recency, most recent last, so lookups are linear: use it for
   * a handful of entries only. Not thread safe.
   */
  template <typename Key, typename Value>
  class LruCache final {
   public:
    explicit LruCache(size_t capacity) : capacity_{capacity} {
      BOOST_ASSERT(capacity_ > 0);
      entries_.reserve(capacity_);
    }

    /// Looks `key` up and marks it as the most recently used one.
    std::optional<std::shared_ptr<const Value>> get(const Key &key) {
      auto it = find(key);
      if (it == entries_.end()) {
        return std::nullopt;
      }
      std::rotate(it, std::next(it), entries_.end());
      return entries_.back().second;
    }

    /// Stores `value` under `key`, replacing a previous one.
    template <typename ValueArg>
    std::shared_ptr<const Value> put(const Key &key, ValueArg &&value) {
      erase(key);
      if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
      }
      auto &entry = entries_.emplace_back(
          key, std::make_shared<Value>(std::forward<ValueArg>(value)));
      return entry.second;
    }

    void erase(const Key &key) {
      if (auto it = find(key); it != entries_.end()) {
        entries_.erase(it);
      }
    }

    size_t size() const {
      return entries_.size();
    }

   private:
    using Entry = std::pair<Key, std::shared_ptr<Value>>;

    typename std::vector<Entry>::iterator find(const Key &key) {
      return std::find_if(entries_.begin(),
                          entries_.end(),
                          [&](const Entry &entry) { return entry.first == key; });
    }

    const size_t capacity_;
    std::vector<Entry> entries_;
  };

}  // namespace tribune
