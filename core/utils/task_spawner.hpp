/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "outcome/outcome.hpp"

namespace tribune::utils {

  enum class SpawnError {
    /// Executor does not accept new work
    POOL_STOPPED = 1,
  };

  /**
   * State shared by a spawned task and its handle.
   */
  class TaskState {
   public:
    /// Marks the task cancelled and runs its cancellation hook, once.
    void cancel() {
      std::function<void()> on_cancel;
      {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
          return;
        }
        on_cancel = std::move(on_cancel_);
        on_cancel_ = nullptr;
      }
      if (on_cancel) {
        on_cancel();
      }
    }

    /**
     * Sets what releases the task's resources on cancellation. Runs it
     * right away if the task is already cancelled.
     */
    void onCancel(std::function<void()> on_cancel) {
      {
        std::lock_guard lock(mutex_);
        if (not cancelled_.load(std::memory_order_acquire)) {
          on_cancel_ = std::move(on_cancel);
          return;
        }
      }
      on_cancel();
    }

    bool isCancelled() const {
      return cancelled_.load(std::memory_order_acquire);
    }

    void finish() {
      finished_.store(true, std::memory_order_release);
    }

    bool isFinished() const {
      return finished_.load(std::memory_order_acquire);
    }

   private:
    std::mutex mutex_;
    std::function<void()> on_cancel_;
    std::atomic_bool cancelled_{false};
    std::atomic_bool finished_{false};
  };

  /**
   * Body of a spawned task. It must not report anything once the state is
   * cancelled, and marks the state finished when done.
   */
  using Task = std::function<void(std::shared_ptr<TaskState>)>;

  /**
   * RAII owner of a spawned task. Destroying or overwriting the handle
   * cancels the task.
   */
  class TaskHandle {
   public:
    explicit TaskHandle(std::shared_ptr<TaskState> state)
        : state_(std::move(state)) {}

    TaskHandle(TaskHandle &&) noexcept = default;
    TaskHandle &operator=(TaskHandle &&other) noexcept {
      if (this != &other) {
        cancel();
        state_ = std::move(other.state_);
      }
      return *this;
    }
    TaskHandle(const TaskHandle &) = delete;
    TaskHandle &operator=(const TaskHandle &) = delete;

    ~TaskHandle() {
      cancel();
    }

    void cancel() {
      if (state_) {
        state_->cancel();
      }
    }

    bool finished() const {
      return state_ and state_->isFinished();
    }

   private:
    std::shared_ptr<TaskState> state_;
  };

  /**
   * Runs tasks concurrently with the caller.
   */
  class TaskSpawner {
   public:
    virtual ~TaskSpawner() = default;

    /**
     * Schedule `task` for execution.
     * @param label name of the task for logs
     * @return handle owning the task, or error if it can't be scheduled
     */
    virtual outcome::result<TaskHandle> spawn(std::string_view label,
                                              Task task) = 0;
  };

}  // namespace tribune::utils

OUTCOME_HPP_DECLARE_ERROR(tribune::utils, SpawnError);
