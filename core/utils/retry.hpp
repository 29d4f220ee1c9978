/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "utils/cancellation.hpp"

namespace conductor {

  enum class RetryError : uint8_t {
    CANCELLED = 1,
    ATTEMPTS_EXHAUSTED,
  };
  Q_ENUM_ERROR_CODE(RetryError) {
    using E = decltype(e);
    switch (e) {
      case E::CANCELLED:
        return "Retry loop was cancelled";
      case E::ATTEMPTS_EXHAUSTED:
        return "Retry attempts exhausted";
    }
    abort();
  }

  struct RetryPolicy {
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{20000};
    /// nullopt retries until cancelled
    std::optional<size_t> max_attempts;

    /// Delay before the attempt following `attempt` failed ones
    std::chrono::milliseconds delayAfter(size_t attempt) const {
      auto delay = initial_delay;
      for (size_t i = 1; i < attempt and delay < max_delay; ++i) {
        delay *= 2;
      }
      return std::min(delay, max_delay);
    }
  };

  /**
   * Calls `f` until it succeeds, sleeping with exponential backoff between
   * attempts. Each failure is logged at warn level with the attempt number.
   * The first attempt is made even if already cancelled. An error for which
   * `is_final` holds is returned at once.
   * @return the first successful result, the final error, or RetryError when
   * cancelled or out of attempts
   */
  template <typename F, typename Final>
  auto retryWithBackoff(const RetryPolicy &policy,
                        Cancellation &cancellation,
                        const log::Logger &logger,
                        std::string_view what,
                        F &&f,
                        Final &&is_final) -> decltype(f()) {
    for (size_t attempt = 1;; ++attempt) {
      auto res = f();
      if (res.has_value()) {
        return res;
      }
      if (is_final(res.error())) {
        SL_DEBUG(logger, "{} failed: {}", what, res.error().message());
        return res;
      }
      if (cancellation.isCancelled()) {
        return RetryError::CANCELLED;
      }
      if (policy.max_attempts and attempt >= *policy.max_attempts) {
        SL_WARN(logger,
                "{} failed after {} attempts: {}",
                what,
                attempt,
                res.error().message());
        return RetryError::ATTEMPTS_EXHAUSTED;
      }
      auto delay = policy.delayAfter(attempt);
      SL_WARN(logger,
              "{} failed (attempt {}): {}; retrying in {} ms",
              what,
              attempt,
              res.error().message(),
              delay.count());
      if (not cancellation.sleepFor(delay)) {
        return RetryError::CANCELLED;
      }
    }
  }

  template <typename F>
  auto retryWithBackoff(const RetryPolicy &policy,
                        Cancellation &cancellation,
                        const log::Logger &logger,
                        std::string_view what,
                        F &&f) -> decltype(f()) {
    return retryWithBackoff(policy,
                            cancellation,
                            logger,
                            what,
                            std::forward<F>(f),
                            [](const auto &) { return false; });
  }

}  // namespace conductor
