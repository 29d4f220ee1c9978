/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <unordered_map>

#include "execution/optimistic_sink.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace conductor::execution {

  enum class OptimisticError : uint8_t {
    WRONG_ROLLUP = 1,
    DUPLICATE,
  };
  Q_ENUM_ERROR_CODE(OptimisticError) {
    using E = decltype(e);
    switch (e) {
      case E::WRONG_ROLLUP:
        return "Soft block belongs to another rollup";
      case E::DUPLICATE:
        return "Soft block was already received";
    }
    abort();
  }

  /**
   * Keeps the most recent soft candidates by sequencer block hash, so that
   * an auctioneer can build on them before they are committed.
   * Thread safe.
   */
  class OptimisticBuffer final : public OptimisticSink {
   public:
    OptimisticBuffer(primitives::RollupId rollup_id, size_t capacity);

    outcome::result<void> onSoftCandidate(
        const primitives::CandidateBlock &block) override;

    /// Removes and returns the candidate with `block_hash`
    std::optional<primitives::CandidateBlock> take(
        const primitives::BlockHash &block_hash);

    /// Most recently received candidate, if any
    std::optional<primitives::CandidateBlock> latest() const;

    size_t size() const;

   private:
    struct Blocks {
      std::unordered_map<primitives::BlockHash, primitives::CandidateBlock>
          by_hash;
      // arrival order, for eviction
      std::deque<primitives::BlockHash> order;
    };

    primitives::RollupId rollup_id_;
    size_t capacity_;
    SafeObject<Blocks> blocks_;
    log::Logger log_;
  };

}  // namespace conductor::execution
