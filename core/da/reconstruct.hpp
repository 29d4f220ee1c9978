/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "normalizer/block_normalizer.hpp"
#include "primitives/celestia_blobs.hpp"

namespace conductor::da {

  /// Sequencer blocks recovered from the blobs of one DA height
  struct Reconstruction {
    primitives::CelestiaHeight celestia_height = 0;
    std::vector<primitives::FilteredSequencerBlock> blocks;
    /// Header blobs listing the rollup without a verified rollup blob
    size_t censored = 0;
    /// Rollup blobs matching no verified header blob
    size_t unmatched_rollup_blobs = 0;
    /// Blobs failing to decode or to verify
    size_t rejected_blobs = 0;
  };

  /**
   * Rebuilds sequencer blocks for the normalizer's rollup from raw blobs:
   *  1. blobs are decoded, header blobs of other chains are ignored;
   *  2. header blobs are verified against their own `data_hash`, a later
   *     blob with the same block hash and height replaces an earlier one;
   *  3. every rollup blob is matched to the first header blob with its
   *     block hash whose rollup transactions root includes it;
   *  4. unmatched header blobs become empty blocks, unless they list the
   *     rollup, which means its data was withheld.
   */
  class BlockReconstructor {
   public:
    BlockReconstructor(std::shared_ptr<const normalizer::BlockNormalizer>
                           normalizer,
                       std::string sequencer_chain_id);

    Reconstruction reconstruct(
        primitives::CelestiaHeight celestia_height,
        const std::vector<common::Buffer> &header_blobs,
        const std::vector<common::Buffer> &rollup_blobs) const;

   private:
    std::vector<primitives::SubmittedMetadata> decodeHeaders(
        const std::vector<common::Buffer> &blobs, size_t &rejected) const;

    std::vector<primitives::SubmittedRollupData> decodeRollupData(
        const std::vector<common::Buffer> &blobs, size_t &rejected) const;

    std::shared_ptr<const normalizer::BlockNormalizer> normalizer_;
    std::string sequencer_chain_id_;
    log::Logger log_;
  };

  /// Block as the sequencer would serve it, without rollup transactions
  primitives::FilteredSequencerBlock toFilteredBlock(
      primitives::SubmittedMetadata metadata);

}  // namespace conductor::da
