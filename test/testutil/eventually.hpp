/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <thread>

namespace testutil {

  /**
   * Polls `condition` until it holds or `timeout` passes.
   * @return the last value of `condition`
   */
  template <typename F>
  bool eventually(F &&condition,
                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (not condition()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return condition();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
  }

}  // namespace testutil
