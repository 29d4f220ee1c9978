/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "normalizer/block_normalizer.hpp"

#include <algorithm>

#include "crypto/sha/sha256.hpp"
#include "merkle/merkle_tree.hpp"
#include "primitives/commitments.hpp"

namespace conductor::normalizer {

  BlockNormalizer::BlockNormalizer(primitives::RollupId rollup_id)
      : rollup_id_{rollup_id},
        log_{log::createLogger("BlockNormalizer", "normalizer")} {}

  outcome::result<primitives::CandidateBlock> BlockNormalizer::normalize(
      primitives::FilteredSequencerBlock block,
      primitives::Origin origin) const {
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(checkCommitments(block));
      OUTCOME_TRY(checkRollupTransactions(block));
      return outcome::success();
    }();
    if (res.has_error()) {
      SL_DEBUG(log_,
               "Rejected {} block {} at height {}: {}",
               origin,
               block.block_hash,
               block.height(),
               res.error().message());
      return res.error();
    }

    primitives::CandidateBlock candidate{
        .origin = origin,
        .block_hash = block.block_hash,
        .header = std::move(block.header),
        .rollup_id = rollup_id_,
        .transactions = {},
        .all_rollup_ids = std::move(block.all_rollup_ids),
    };
    if (block.rollup_transactions) {
      candidate.transactions =
          std::move(block.rollup_transactions->transactions);
    }
    SL_TRACE(log_,
             "Normalized {} block at height {} with {} transactions",
             origin,
             candidate.height(),
             candidate.transactions.size());
    return candidate;
  }

  outcome::result<void> BlockNormalizer::checkCommitments(
      const primitives::FilteredSequencerBlock &block) const {
    OUTCOME_TRY(checkRollupTransactionsRoot(block));
    OUTCOME_TRY(checkRollupIds(block));
    return outcome::success();
  }

  outcome::result<void> BlockNormalizer::checkRollupTransactionsRoot(
      const primitives::FilteredSequencerBlock &block) const {
    const auto &header = block.header;
    const auto &proof = block.rollup_transactions_proof;
    if (proof.leaf_index != primitives::kRollupTransactionsRootIndex) {
      return NormalizeError::BAD_PROOF;
    }
    auto leaf = crypto::sha256(header.rollup_transactions_root);
    if (not merkle::verify(leaf, proof, header.data_hash)) {
      return NormalizeError::BAD_PROOF;
    }
    return outcome::success();
  }

  outcome::result<void> BlockNormalizer::checkRollupIds(
      const primitives::FilteredSequencerBlock &block) const {
    const auto &header = block.header;
    const auto &proof = block.rollup_ids_proof;
    if (proof.leaf_index != primitives::kRollupIdsRootIndex) {
      return NormalizeError::MISSING_IDS_PROOF;
    }
    auto ids_root = primitives::rollupIdsRoot(block.all_rollup_ids);
    if (ids_root != header.rollup_ids_root) {
      return NormalizeError::MISSING_IDS_PROOF;
    }
    auto leaf = crypto::sha256(ids_root);
    if (not merkle::verify(leaf, proof, header.data_hash)) {
      return NormalizeError::MISSING_IDS_PROOF;
    }
    return outcome::success();
  }

  outcome::result<void> BlockNormalizer::checkRollupTransactions(
      const primitives::FilteredSequencerBlock &block) const {
    const auto &ids = block.all_rollup_ids;
    const bool listed =
        std::find(ids.begin(), ids.end(), rollup_id_) != ids.end();

    if (not block.rollup_transactions) {
      // block without our transactions must not claim to contain them
      if (listed) {
        return NormalizeError::WRONG_ROLLUP;
      }
      return outcome::success();
    }

    const auto &rollup = *block.rollup_transactions;
    if (rollup.rollup_id != rollup_id_) {
      return NormalizeError::WRONG_ROLLUP;
    }
    if (not listed) {
      return NormalizeError::MISSING_IDS_PROOF;
    }
    auto leaf =
        primitives::rollupTransactionsLeaf(rollup.rollup_id, rollup.transactions);
    if (not merkle::verify(
            leaf, rollup.proof, block.header.rollup_transactions_root)) {
      return NormalizeError::WRONG_ROLLUP;
    }
    return outcome::success();
  }

}  // namespace conductor::normalizer
