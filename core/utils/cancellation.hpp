/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace conductor {

  /**
   * One-shot cancellation flag shared between a task and its owner.
   * Sleeping through `sleepFor` is interrupted by `cancel`.
   */
  class Cancellation {
   public:
    void cancel() {
      std::vector<std::function<void()>> callbacks;
      {
        std::lock_guard lock(mutex_);
        if (cancelled_) {
          return;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
      }
      cv_.notify_all();
      for (auto &cb : callbacks) {
        cb();
      }
    }

    bool isCancelled() const {
      std::lock_guard lock(mutex_);
      return cancelled_;
    }

    /// @return false if cancelled before the delay elapsed
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> delay) {
      std::unique_lock lock(mutex_);
      return not cv_.wait_for(lock, delay, [&] { return cancelled_; });
    }

    /// Runs `cb` on cancellation, or immediately if already cancelled
    void onCancel(std::function<void()> cb) {
      {
        std::lock_guard lock(mutex_);
        if (not cancelled_) {
          callbacks_.emplace_back(std::move(cb));
          return;
        }
      }
      cb();
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::vector<std::function<void()>> callbacks_;
  };

}  // namespace conductor
