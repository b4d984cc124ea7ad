/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>

#include "outcome/outcome.hpp"
#include "utils/safe_object.hpp"

namespace tribune::utils {

  enum class OneshotError {
    /// Sending half was dropped without providing a value
    CANCELED = 1,
    /// Receiving half was dropped, nobody waits for the value
    RECEIVER_DROPPED,
    /// Value was already sent
    ALREADY_SENT,
  };

}  // namespace tribune::utils

OUTCOME_HPP_DECLARE_ERROR(tribune::utils, OneshotError);

namespace tribune::utils {

  /**
   * Single value slot shared by a producer and a consumer living on
   * different threads. The consumer registers a callback which is invoked
   * exactly once: with the value, or with `OneshotError::CANCELED` when the
   * producer goes away without sending.
   */
  template <typename T>
  class Oneshot {
   public:
    using Result = outcome::result<T>;
    using Callback = std::function<void(Result)>;

   private:
    struct State {
      std::optional<Result> value;
      Callback callback;
      bool sent = false;
      bool receiver_alive = true;
    };
    using SharedState = std::shared_ptr<SafeObject<State>>;

   public:
    class Sender {
     public:
      explicit Sender(SharedState state) : state_(std::move(state)) {}
      Sender(Sender &&) noexcept = default;
      Sender &operator=(Sender &&) noexcept = default;
      Sender(const Sender &) = delete;
      Sender &operator=(const Sender &) = delete;

      ~Sender() {
        if (state_) {
          std::ignore = complete(OneshotError::CANCELED);
        }
      }

      outcome::result<void> send(Result value) {
        if (not state_) {
          return OneshotError::ALREADY_SENT;
        }
        auto res = complete(std::move(value));
        state_.reset();
        return res;
      }

      /// Whether the receiving side is gone.
      bool isCanceled() const {
        return not state_ or state_->exclusiveAccess([](State &state) {
          return not state.receiver_alive;
        });
      }

     private:
      outcome::result<void> complete(Result value) {
        Callback callback;
        auto res = state_->exclusiveAccess(
            [&](State &state) -> outcome::result<void> {
              if (state.sent) {
                return OneshotError::ALREADY_SENT;
              }
              state.sent = true;
              if (not state.receiver_alive) {
                return OneshotError::RECEIVER_DROPPED;
              }
              if (state.callback) {
                callback = std::move(state.callback);
                state.callback = nullptr;
              } else {
                state.value.emplace(std::move(value));
              }
              return outcome::success();
            });
        if (callback) {
          callback(std::move(value));
        }
        return res;
      }

      SharedState state_;
    };

    class Receiver {
     public:
      explicit Receiver(SharedState state) : state_(std::move(state)) {}
      Receiver(Receiver &&) noexcept = default;
      Receiver &operator=(Receiver &&) noexcept = default;
      Receiver(const Receiver &) = delete;
      Receiver &operator=(const Receiver &) = delete;

      ~Receiver() {
        close();
      }

      /**
       * Stops waiting: the registered callback is dropped without being
       * called and the sender sees the receiver as gone.
       */
      void close() {
        if (not state_) {
          return;
        }
        Callback callback;
        state_->exclusiveAccess([&](State &state) {
          state.receiver_alive = false;
          callback = std::move(state.callback);
          state.callback = nullptr;
        });
      }

      /**
       * Registers `callback` to be called with the result. Called
       * immediately when the result is already there, otherwise from the
       * thread completing the sender. Ignored once the receiver is closed.
       */
      void onReady(Callback callback) {
        std::optional<Result> ready;
        state_->exclusiveAccess([&](State &state) {
          if (not state.receiver_alive) {
            return;
          }
          if (state.value.has_value()) {
            ready = std::move(state.value);
            state.value.reset();
          } else {
            state.callback = std::move(callback);
          }
        });
        if (ready.has_value()) {
          callback(std::move(ready.value()));
        }
      }

     private:
      SharedState state_;
    };

    static std::pair<Sender, Receiver> create() {
      auto state = std::make_shared<SafeObject<State>>();
      return {Sender{state}, Receiver{state}};
    }
  };

}  // namespace tribune::utils
