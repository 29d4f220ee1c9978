/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "primitives/common.hpp"
#include "utils/safe_object.hpp"

namespace conductor::state {

  /**
   * Progress shared between the reconciliation engine and the sources.
   * The engine writes the expected heights and the pause flag, the firm
   * source writes its DA progress.
   */
  struct SourceHeights {
    /// Sequencer height of the next soft block to execute
    primitives::SequencerHeight next_soft = 0;
    /// Sequencer height of the next firm block to commit
    primitives::SequencerHeight next_firm = 0;
    /// Soft source must not fetch while soft is too far ahead of firm
    bool soft_paused = false;
    /// DA height the firm search starts from
    primitives::CelestiaHeight celestia_search_height = 0;

    /// Firm source scanned everything up to the DA head
    bool firm_caught_up = false;
    primitives::CelestiaHeight celestia_head = 0;
    /// Firm verification failures since the last committed firm block
    size_t consecutive_firm_failures = 0;
  };

  using SharedSourceHeights = std::shared_ptr<SafeObject<SourceHeights>>;

}  // namespace conductor::state
