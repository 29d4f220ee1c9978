/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/height_mapping.hpp"

#include <limits>

namespace conductor::primitives {

  outcome::result<SequencerHeight> sequencerHeightOf(
      const ExecutionSessionParameters &params, BlockNumber number) {
    const auto start = params.rollup_start_block_number;
    if (number == std::numeric_limits<BlockNumber>::max()
        or start > number + 1) {
      return MappingError::BEFORE_SESSION_START;
    }
    // start <= number + 1, so the offset is at least -1
    const auto seq_start = params.sequencer_start_block_height;
    if (start == number + 1) {
      if (seq_start == 0) {
        return MappingError::OVERFLOW;
      }
      return seq_start - 1;
    }
    const auto offset = number - start;
    if (offset > std::numeric_limits<SequencerHeight>::max() - seq_start) {
      return MappingError::OVERFLOW;
    }
    return seq_start + offset;
  }

  outcome::result<BlockNumber> rollupNumberOf(
      const ExecutionSessionParameters &params, SequencerHeight height) {
    const auto seq_start = params.sequencer_start_block_height;
    if (height < seq_start) {
      return MappingError::BELOW_SEQUENCER_START;
    }
    const auto offset = height - seq_start;
    const auto start = params.rollup_start_block_number;
    if (offset > std::numeric_limits<BlockNumber>::max() - start) {
      return MappingError::OVERFLOW;
    }
    return start + offset;
  }

  outcome::result<SequencerHeight> nextSequencerHeight(
      const ExecutionSessionParameters &params, BlockNumber number) {
    if (params.rollup_start_block_number == number + 1) {
      return params.sequencer_start_block_height;
    }
    OUTCOME_TRY(height, sequencerHeightOf(params, number));
    if (height == std::numeric_limits<SequencerHeight>::max()) {
      return MappingError::OVERFLOW;
    }
    return height + 1;
  }

  std::optional<SequencerHeight> sequencerStopHeight(
      const ExecutionSessionParameters &params) {
    if (not params.isBounded()) {
      return std::nullopt;
    }
    auto height = sequencerHeightOf(params, params.rollup_end_block_number);
    if (height.has_error()) {
      return std::nullopt;
    }
    return height.value();
  }

}  // namespace conductor::primitives
