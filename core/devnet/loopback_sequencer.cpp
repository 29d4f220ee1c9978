/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/loopback_sequencer.hpp"

#include "devnet/devnet_error.hpp"

namespace conductor::devnet {

  LoopbackSequencer::LoopbackSequencer(std::string chain_id)
      : chain_id_{std::move(chain_id)} {}

  bool LoopbackSequencer::injectFailure() {
    auto left = failures_to_inject_.load();
    while (left > 0) {
      if (failures_to_inject_.compare_exchange_weak(left, left - 1)) {
        return true;
      }
    }
    return false;
  }

  void LoopbackSequencer::failNext(size_t count) {
    failures_to_inject_ = count;
  }

  outcome::result<std::string> LoopbackSequencer::getChainId() {
    if (injectFailure()) {
      return DevnetError::UNAVAILABLE;
    }
    return chain_id_;
  }

  outcome::result<primitives::SequencerHeight>
  LoopbackSequencer::getLatestHeight() {
    if (injectFailure()) {
      return DevnetError::UNAVAILABLE;
    }
    return blocks_.sharedAccess(
        [](const auto &blocks) -> outcome::result<primitives::SequencerHeight> {
          if (blocks.empty()) {
            return DevnetError::NO_SUCH_BLOCK;
          }
          return blocks.rbegin()->first;
        });
  }

  outcome::result<primitives::FilteredSequencerBlock>
  LoopbackSequencer::getFilteredBlock(primitives::SequencerHeight height,
                                      const primitives::RollupId &rollup_id) {
    ++filtered_block_requests_;
    if (injectFailure()) {
      return DevnetError::UNAVAILABLE;
    }
    auto block = this->block(height);
    if (not block) {
      return DevnetError::NO_SUCH_BLOCK;
    }
    return block->filter(rollup_id);
  }

  void LoopbackSequencer::push(SequencerBlock block) {
    blocks_.exclusiveAccess([&](auto &blocks) {
      auto height = block.height();
      blocks.insert_or_assign(height, std::move(block));
    });
  }

  std::optional<SequencerBlock> LoopbackSequencer::block(
      primitives::SequencerHeight height) const {
    return blocks_.sharedAccess(
        [&](const auto &blocks) -> std::optional<SequencerBlock> {
          auto it = blocks.find(height);
          if (it == blocks.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

}  // namespace conductor::devnet
