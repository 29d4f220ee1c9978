/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "outcome/outcome.hpp"
#include "primitives/sequencer_block.hpp"

namespace conductor::sequencer {

  /**
   * Access to the sequencing network. Implementations must be safe to call
   * from several threads.
   */
  class SequencerClient {
   public:
    virtual ~SequencerClient() = default;

    virtual outcome::result<std::string> getChainId() = 0;

    virtual outcome::result<primitives::SequencerHeight> getLatestHeight() = 0;

    /// Block at `height` with only the transactions of `rollup_id`
    virtual outcome::result<primitives::FilteredSequencerBlock>
    getFilteredBlock(primitives::SequencerHeight height,
                     const primitives::RollupId &rollup_id) = 0;
  };

}  // namespace conductor::sequencer
