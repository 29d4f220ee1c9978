/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include <boost/assert.hpp>

#include "utils/safe_object.hpp"

namespace conductor {

  /**
   * Bounded FIFO between one producer thread and one consumer thread.
   * `send` blocks while the channel is full. Closing wakes both sides;
   * buffered items remain receivable after close.
   * An optional shared `WaitForSingleObject` is signalled on every send and
   * on close, so one consumer may wait on several channels at once.
   */
  template <typename T>
  class BoundedChannel {
   public:
    explicit BoundedChannel(
        size_t capacity,
        std::shared_ptr<WaitForSingleObject> readiness = nullptr)
        : capacity_{capacity}, readiness_{std::move(readiness)} {
      BOOST_ASSERT(capacity_ > 0);
    }

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    /**
     * Enqueue a value, waiting for free space.
     * @return false if the channel was closed, value is dropped then
     */
    bool send(T value) {
      {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock,
                       [&] { return closed_ or queue_.size() < capacity_; });
        if (closed_) {
          return false;
        }
        queue_.emplace_back(std::move(value));
      }
      not_empty_.notify_one();
      notifyReadiness();
      return true;
    }

    /// Non-blocking receive
    std::optional<T> tryReceive() {
      std::optional<T> res;
      {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) {
          return std::nullopt;
        }
        res.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }
      not_full_.notify_one();
      return res;
    }

    /**
     * Blocking receive.
     * @return nullopt once the channel is closed and drained
     */
    std::optional<T> receive() {
      std::optional<T> res;
      {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [&] { return closed_ or not queue_.empty(); });
        if (queue_.empty()) {
          return std::nullopt;
        }
        res.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }
      not_full_.notify_one();
      return res;
    }

    void close() {
      {
        std::lock_guard lock(mutex_);
        closed_ = true;
      }
      not_full_.notify_all();
      not_empty_.notify_all();
      notifyReadiness();
    }

    bool isClosed() const {
      std::lock_guard lock(mutex_);
      return closed_;
    }

    /// Closed and nothing left to receive
    bool isDrained() const {
      std::lock_guard lock(mutex_);
      return closed_ and queue_.empty();
    }

    size_t size() const {
      std::lock_guard lock(mutex_);
      return queue_.size();
    }

    size_t capacity() const {
      return capacity_;
    }

   private:
    void notifyReadiness() {
      if (readiness_) {
        readiness_->set();
      }
    }

    const size_t capacity_;
    std::shared_ptr<WaitForSingleObject> readiness_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
  };

}  // namespace conductor
