/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/candidate_block.hpp"

namespace conductor::normalizer {

  enum class NormalizeError : uint8_t {
    BAD_PROOF = 1,
    WRONG_ROLLUP,
    MISSING_IDS_PROOF,
  };
  Q_ENUM_ERROR_CODE(NormalizeError) {
    using E = decltype(e);
    switch (e) {
      case E::BAD_PROOF:
        return "Rollup transactions root is not included in the block data "
               "hash";
      case E::WRONG_ROLLUP:
        return "Rollup transactions do not belong to the block or to the "
               "expected rollup";
      case E::MISSING_IDS_PROOF:
        return "Rollup ids of the block are not included in the block data "
               "hash";
    }
    abort();
  }

  /**
   * Turns a sequencer block filtered for one rollup into a CandidateBlock,
   * after checking that
   *  - the rollup transactions root is committed to by `data_hash`,
   *  - the rollup's transactions are included in that root,
   *  - the listed rollup ids are committed to by `data_hash`.
   * A block without transactions for the rollup must not list its id.
   */
  class BlockNormalizer {
   public:
    explicit BlockNormalizer(primitives::RollupId rollup_id);

    outcome::result<primitives::CandidateBlock> normalize(
        primitives::FilteredSequencerBlock block,
        primitives::Origin origin) const;

    /// Checks that both roots of the header are committed to by `data_hash`
    outcome::result<void> checkCommitments(
        const primitives::FilteredSequencerBlock &block) const;

    /// Checks the rollup's transactions (or their absence) against the block
    outcome::result<void> checkRollupTransactions(
        const primitives::FilteredSequencerBlock &block) const;

    const primitives::RollupId &rollupId() const {
      return rollup_id_;
    }

   private:
    outcome::result<void> checkRollupTransactionsRoot(
        const primitives::FilteredSequencerBlock &block) const;

    outcome::result<void> checkRollupIds(
        const primitives::FilteredSequencerBlock &block) const;

    primitives::RollupId rollup_id_;
    log::Logger log_;
  };

}  // namespace conductor::normalizer
