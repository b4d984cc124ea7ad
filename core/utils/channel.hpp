/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"
#include "utils/safe_object.hpp"

namespace tribune::utils {

  enum class ChannelError {
    /// The receiving half of the channel is gone
    RECEIVER_DROPPED = 1,
  };

}  // namespace tribune::utils

OUTCOME_HPP_DECLARE_ERROR(tribune::utils, ChannelError);

namespace tribune::utils {

  /**
   * Unbounded multi-producer single-consumer queue.
   *
   * `Sender` is cheap to copy and may be used from any thread. `Receiver`
   * belongs to one owner; dropping it makes every further `send` fail with
   * `ChannelError::RECEIVER_DROPPED`. Messages of one sender are received in
   * the order they were sent.
   */
  template <typename T>
  class Channel {
    struct State {
      std::deque<T> queue;
      std::function<void()> on_message;
    };
    using Queue = SafeObject<State>;

   public:
    class Sender {
     public:
      explicit Sender(std::weak_ptr<Queue> queue) : queue_(std::move(queue)) {}

      outcome::result<void> send(T message) const {
        auto queue = queue_.lock();
        if (not queue) {
          return ChannelError::RECEIVER_DROPPED;
        }
        auto on_message = queue->exclusiveAccess([&](State &state) {
          state.queue.emplace_back(std::move(message));
          return state.on_message;
        });
        if (on_message) {
          on_message();
        }
        return outcome::success();
      }

     private:
      std::weak_ptr<Queue> queue_;
    };

    class Receiver {
     public:
      explicit Receiver(std::shared_ptr<Queue> queue)
          : queue_(std::move(queue)) {}

      Receiver(Receiver &&) noexcept = default;
      Receiver &operator=(Receiver &&) noexcept = default;
      Receiver(const Receiver &) = delete;
      Receiver &operator=(const Receiver &) = delete;

      /// Makes a new sending half, as long as this receiver lives.
      Sender sender() const {
        return Sender{queue_};
      }

      /**
       * Sets the function called (from the sending thread, outside of the
       * queue lock) after each message is queued.
       */
      void setOnMessage(std::function<void()> on_message) {
        queue_->exclusiveAccess(
            [&](State &state) { state.on_message = std::move(on_message); });
      }

      std::optional<T> tryRecv() {
        return queue_->exclusiveAccess([](State &state) -> std::optional<T> {
          if (state.queue.empty()) {
            return std::nullopt;
          }
          auto message = std::move(state.queue.front());
          state.queue.pop_front();
          return message;
        });
      }

      /// Takes all queued messages at once.
      std::vector<T> drain() {
        return queue_->exclusiveAccess([](State &state) {
          std::vector<T> messages;
          messages.reserve(state.queue.size());
          for (auto &message : state.queue) {
            messages.emplace_back(std::move(message));
          }
          state.queue.clear();
          return messages;
        });
      }

      size_t size() const {
        return queue_->exclusiveAccess(
            [](State &state) { return state.queue.size(); });
      }

     private:
      std::shared_ptr<Queue> queue_;
    };

    static std::pair<Sender, Receiver> create() {
      auto queue = std::make_shared<Queue>();
      return {Sender{queue}, Receiver{queue}};
    }
  };

}  // namespace tribune::utils
