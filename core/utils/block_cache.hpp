/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "outcome/outcome.hpp"

namespace conductor {

  enum class BlockCacheError : uint8_t {
    ALREADY_CACHED = 1,
    BELOW_NEXT_HEIGHT,
    FULL,
  };
  Q_ENUM_ERROR_CODE(BlockCacheError) {
    using E = decltype(e);
    switch (e) {
      case E::ALREADY_CACHED:
        return "Block of the same height is already cached";
      case E::BELOW_NEXT_HEIGHT:
        return "Block height is below the next height to release";
      case E::FULL:
        return "Block cache is full";
    }
    abort();
  }

  /**
   * Buffers blocks arriving out of order and releases them strictly by
   * consecutive height, starting at `next_height`.
   * @tparam Block type providing `height()`
   */
  template <typename Block>
  class BlockCache {
   public:
    BlockCache(uint64_t next_height, size_t max_size)
        : next_height_{next_height}, max_size_{max_size} {}

    outcome::result<void> insert(Block block) {
      const uint64_t height = block.height();
      if (height < next_height_) {
        return BlockCacheError::BELOW_NEXT_HEIGHT;
      }
      if (blocks_.contains(height)) {
        return BlockCacheError::ALREADY_CACHED;
      }
      // the next block is always accepted, so a full cache cannot stall
      if (blocks_.size() >= max_size_ and height != next_height_) {
        return BlockCacheError::FULL;
      }
      blocks_.emplace(height, std::move(block));
      return outcome::success();
    }

    /// Releases the block at the next height, if it is cached
    std::optional<Block> pop() {
      auto it = blocks_.find(next_height_);
      if (it == blocks_.end()) {
        return std::nullopt;
      }
      std::optional<Block> block{std::move(it->second)};
      blocks_.erase(it);
      ++next_height_;
      return block;
    }

    /// Drops cached blocks and restarts from `next_height`
    void reset(uint64_t next_height) {
      blocks_.clear();
      next_height_ = next_height;
    }

    uint64_t nextHeight() const {
      return next_height_;
    }

    bool contains(uint64_t height) const {
      return blocks_.contains(height);
    }

    size_t size() const {
      return blocks_.size();
    }

    bool empty() const {
      return blocks_.empty();
    }

   private:
    uint64_t next_height_;
    size_t max_size_;
    std::map<uint64_t, Block> blocks_;
  };

}  // namespace conductor
