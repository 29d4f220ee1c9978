/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <boost/assert.hpp>

#include "primitives/content_digest.hpp"
#include "primitives/execution.hpp"

namespace conductor::reconciliation {

  using primitives::ContentDigest;

  struct PendingBlock {
    primitives::ExecutedBlockMetadata executed;
    ContentDigest digest;
  };

  /**
   * Soft-executed blocks awaiting their firm counterpart, by rollup number.
   * When full, the lowest number is evicted.
   */
  class PendingBlocks {
   public:
    explicit PendingBlocks(size_t capacity) : capacity_{capacity} {
      BOOST_ASSERT(capacity_ > 0);
    }

    void put(PendingBlock block) {
      auto number = block.executed.number;
      blocks_.insert_or_assign(number, std::move(block));
      while (blocks_.size() > capacity_) {
        blocks_.erase(blocks_.begin());
      }
    }

    std::optional<PendingBlock> get(primitives::BlockNumber number) const {
      auto it = blocks_.find(number);
      if (it == blocks_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    /// Forgets blocks up to and including `number`
    void eraseUpTo(primitives::BlockNumber number) {
      blocks_.erase(blocks_.begin(), blocks_.upper_bound(number));
    }

    /// Forgets blocks above `number`
    void eraseAbove(primitives::BlockNumber number) {
      blocks_.erase(blocks_.upper_bound(number), blocks_.end());
    }

    void clear() {
      blocks_.clear();
    }

    size_t size() const {
      return blocks_.size();
    }

   private:
    size_t capacity_;
    std::map<primitives::BlockNumber, PendingBlock> blocks_;
  };

}  // namespace conductor::reconciliation
