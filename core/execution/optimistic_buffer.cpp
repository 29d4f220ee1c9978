/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "execution/optimistic_buffer.hpp"

#include <algorithm>

namespace conductor::execution {

  OptimisticBuffer::OptimisticBuffer(primitives::RollupId rollup_id,
                                     size_t capacity)
      : rollup_id_{rollup_id},
        capacity_{capacity},
        log_{log::createLogger("OptimisticBuffer", "optimistic")} {
    BOOST_ASSERT(capacity_ > 0);
  }

  outcome::result<void> OptimisticBuffer::onSoftCandidate(
      const primitives::CandidateBlock &block) {
    if (block.rollup_id != rollup_id_) {
      return OptimisticError::WRONG_ROLLUP;
    }
    return blocks_.exclusiveAccess(
        [&](Blocks &blocks) -> outcome::result<void> {
          if (blocks.by_hash.contains(block.block_hash)) {
            return OptimisticError::DUPLICATE;
          }
          blocks.by_hash.emplace(block.block_hash, block);
          blocks.order.push_back(block.block_hash);
          while (blocks.order.size() > capacity_) {
            blocks.by_hash.erase(blocks.order.front());
            blocks.order.pop_front();
          }
          SL_TRACE(log_,
                   "Soft block {} at height {} with {} transactions buffered",
                   block.block_hash,
                   block.height(),
                   block.transactions.size());
          return outcome::success();
        });
  }

  std::optional<primitives::CandidateBlock> OptimisticBuffer::take(
      const primitives::BlockHash &block_hash) {
    return blocks_.exclusiveAccess(
        [&](Blocks &blocks) -> std::optional<primitives::CandidateBlock> {
          auto it = blocks.by_hash.find(block_hash);
          if (it == blocks.by_hash.end()) {
            return std::nullopt;
          }
          auto block = std::move(it->second);
          blocks.by_hash.erase(it);
          std::erase(blocks.order, block_hash);
          return block;
        });
  }

  std::optional<primitives::CandidateBlock> OptimisticBuffer::latest() const {
    return blocks_.sharedAccess(
        [&](const Blocks &blocks) -> std::optional<primitives::CandidateBlock> {
          if (blocks.order.empty()) {
            return std::nullopt;
          }
          return blocks.by_hash.at(blocks.order.back());
        });
  }

  size_t OptimisticBuffer::size() const {
    return blocks_.sharedAccess(
        [](const Blocks &blocks) { return blocks.by_hash.size(); });
  }

}  // namespace conductor::execution
