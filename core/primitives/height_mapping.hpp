/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/execution.hpp"

namespace conductor::primitives {

  enum class MappingError : uint8_t {
    BEFORE_SESSION_START = 1,
    BELOW_SEQUENCER_START,
    OVERFLOW,
  };
  Q_ENUM_ERROR_CODE(MappingError) {
    using E = decltype(e);
    switch (e) {
      case E::BEFORE_SESSION_START:
        return "Rollup number is before the start of the execution session";
      case E::BELOW_SEQUENCER_START:
        return "Sequencer height is below the session's first sequencer "
               "height";
      case E::OVERFLOW:
        return "Height mapping overflows";
    }
    abort();
  }

  /**
   * Sequencer height that produced rollup block `number`:
   * sequencer_start + number - rollup_start.
   * The block before the first session block (number = rollup_start - 1)
   * maps to sequencer_start - 1.
   */
  outcome::result<SequencerHeight> sequencerHeightOf(
      const ExecutionSessionParameters &params, BlockNumber number);

  /// Inverse of sequencerHeightOf
  outcome::result<BlockNumber> rollupNumberOf(
      const ExecutionSessionParameters &params, SequencerHeight height);

  /// Sequencer height to fetch after the block at `number` was executed
  outcome::result<SequencerHeight> nextSequencerHeight(
      const ExecutionSessionParameters &params, BlockNumber number);

  /// Sequencer height of the session's last block, if the session is bounded
  std::optional<SequencerHeight> sequencerStopHeight(
      const ExecutionSessionParameters &params);

}  // namespace conductor::primitives
