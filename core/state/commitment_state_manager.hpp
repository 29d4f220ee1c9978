/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "execution/execution_driver.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/candidate_block.hpp"
#include "primitives/content_digest.hpp"
#include "primitives/execution.hpp"
#include "storage/spaced_storage.hpp"

namespace conductor::state {

  enum class StateError : uint8_t {
    FIRM_AHEAD_OF_SOFT = 1,
    NON_CONSECUTIVE,
    NOT_LOADED,
    CORRUPTED,
  };
  Q_ENUM_ERROR_CODE(StateError) {
    using E = decltype(e);
    switch (e) {
      case E::FIRM_AHEAD_OF_SOFT:
        return "Firm commitment would be above the soft one";
      case E::NON_CONSECUTIVE:
        return "Commitment does not extend the current one by one block";
      case E::NOT_LOADED:
        return "Commitment state is not loaded";
      case E::CORRUPTED:
        return "Stored commitment state violates its invariants";
    }
    abort();
  }

  /**
   * Owner of the durable CommitmentState. Every update is encoded and
   * written as one record before the in-memory copy is replaced, then
   * forwarded to the execution engine.
   * Not thread safe: the reconciliation engine is its only user.
   */
  class CommitmentStateManager {
   public:
    CommitmentStateManager(std::shared_ptr<storage::SpacedStorage> storage,
                           std::shared_ptr<execution::ExecutionDriver> driver);

    /**
     * Reads the stored state. Without one, or with one older than the
     * session, the state is pinned to the block preceding the session's
     * first block as the execution engine reports it.
     */
    outcome::result<primitives::CommitmentState> load(
        const primitives::ExecutionSessionParameters &session);

    /**
     * Moves one pointer to `metadata`, which must be the next block of that
     * pointer. A firm advance may carry the DA height its block was found at.
     */
    outcome::result<void> advance(
        primitives::Origin origin,
        const primitives::ExecutedBlockMetadata &metadata,
        std::optional<primitives::CelestiaHeight> celestia_height =
            std::nullopt);

    /// Moves soft and firm to `metadata` executed from a firm block
    outcome::result<void> advanceBoth(
        const primitives::ExecutedBlockMetadata &metadata,
        std::optional<primitives::CelestiaHeight> celestia_height =
            std::nullopt);

    /// Moves soft back to `metadata`, not below firm
    outcome::result<void> rollback(
        const primitives::ExecutedBlockMetadata &metadata);

    /**
     * Stores what soft block `number` is executed from, so a firm block can
     * be compared against it after a restart. Records are dropped once the
     * block is firm or rolled back.
     */
    outcome::result<void> recordSoftContent(
        primitives::BlockNumber number,
        const primitives::ContentDigest &digest);

    outcome::result<std::optional<primitives::ContentDigest>> softContent(
        primitives::BlockNumber number) const;

    /// Raises the DA search height, lower values are ignored
    outcome::result<void> setCelestiaSearchHeight(
        primitives::CelestiaHeight height);

    /// @pre load() succeeded
    const primitives::CommitmentState &state() const {
      return state_.value();
    }

    bool isLoaded() const {
      return state_.has_value();
    }

   private:
    outcome::result<std::optional<primitives::CommitmentState>> read() const;

    /// Writes `next`, swaps it in and forwards it to the execution engine
    outcome::result<void> persist(primitives::CommitmentState next);

    /// Removes the soft content records of blocks `from` to `to`
    outcome::result<void> forgetSoftContent(primitives::BlockNumber from,
                                            primitives::BlockNumber to);

    static common::Buffer softContentKey(primitives::BlockNumber number);

    static primitives::CelestiaHeight raised(
        primitives::CelestiaHeight current,
        std::optional<primitives::CelestiaHeight> candidate);

    std::shared_ptr<storage::BufferStorage> storage_;
    std::shared_ptr<execution::ExecutionDriver> driver_;
    std::optional<primitives::CommitmentState> state_;
    log::Logger log_;
  };

}  // namespace conductor::state
