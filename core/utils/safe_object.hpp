/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

namespace tribune {

  /**
   * Object reachable only under its own mutex.
   * @code
   *  SafeObject<std::deque<int>> queue;
   *  queue.exclusiveAccess([](auto &q) { q.push_back(1); });
   * @endcode
   */
  template <typename T>
  class SafeObject {
   public:
    template <typename... Args>
    explicit SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    auto exclusiveAccess(F &&f) {
      std::lock_guard lock(mutex_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    std::mutex mutex_;
  };

}  // namespace tribune
