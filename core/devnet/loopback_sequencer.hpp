/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>

#include "devnet/block_builder.hpp"
#include "sequencer/sequencer_client.hpp"
#include "utils/safe_object.hpp"

namespace conductor::devnet {

  /// Sequencing network kept in memory
  class LoopbackSequencer final : public sequencer::SequencerClient {
   public:
    explicit LoopbackSequencer(std::string chain_id);

    outcome::result<std::string> getChainId() override;

    outcome::result<primitives::SequencerHeight> getLatestHeight() override;

    outcome::result<primitives::FilteredSequencerBlock> getFilteredBlock(
        primitives::SequencerHeight height,
        const primitives::RollupId &rollup_id) override;

    /// Adds the block, replacing one at the same height
    void push(SequencerBlock block);

    std::optional<SequencerBlock> block(
        primitives::SequencerHeight height) const;

    /// Makes the next `count` calls fail with UNAVAILABLE
    void failNext(size_t count);

    size_t filteredBlockRequests() const {
      return filtered_block_requests_;
    }

   private:
    bool injectFailure();

    std::string chain_id_;
    SafeObject<std::map<primitives::SequencerHeight, SequencerBlock>> blocks_;
    std::atomic_size_t failures_to_inject_ = 0;
    std::atomic_size_t filtered_block_requests_ = 0;
  };

}  // namespace conductor::devnet
