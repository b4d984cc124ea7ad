/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace tribune {

  inline bool runningInThisThread(
      const std::shared_ptr<boost::asio::io_context> &ioc) {
    return ioc->get_executor().running_in_this_thread();
  }

  /**
   * Posts work onto an `io_context` while started. Work posted after
   * `stop()` is silently dropped; work posted before `start()` is a logic
   * error.
   */
  class PoolHandler {
   public:
    PoolHandler(PoolHandler &&) = delete;
    PoolHandler(const PoolHandler &) = delete;

    PoolHandler &operator=(PoolHandler &&) = delete;
    PoolHandler &operator=(const PoolHandler &) = delete;

    explicit PoolHandler(std::shared_ptr<boost::asio::io_context> io_context)
        : is_active_{false}, ioc_{std::move(io_context)} {}
    ~PoolHandler() = default;

    void start() {
      started_ = true;
      is_active_.store(true);
    }

    void stop() {
      is_active_.store(false);
    }

    bool isActive() const {
      return is_active_.load(std::memory_order_acquire);
    }

    template <typename F>
    void execute(F &&func) {
      if (is_active_.load(std::memory_order_acquire)) {
        boost::asio::post(*ioc_, std::forward<F>(func));
      } else if (not started_) {
        throw std::logic_error{"PoolHandler lost callback before start()"};
      }
    }

   private:
    std::atomic_bool is_active_;
    std::atomic_bool started_ = false;
    std::shared_ptr<boost::asio::io_context> ioc_;
  };

}  // namespace tribune
