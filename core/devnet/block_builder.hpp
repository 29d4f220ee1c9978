/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include "primitives/celestia_blobs.hpp"
#include "primitives/sequencer_block.hpp"

namespace conductor::devnet {

  using RollupTransactionsMap =
      std::map<primitives::RollupId, std::vector<primitives::Transaction>>;

  /**
   * Complete sequencer block with the transactions of every rollup, as the
   * sequencing network would commit it
   */
  struct SequencerBlock {
    primitives::BlockHash block_hash;
    primitives::SequencerBlockHeader header;
    RollupTransactionsMap rollups;
    merkle::Proof rollup_transactions_proof;
    merkle::Proof rollup_ids_proof;

    primitives::SequencerHeight height() const {
      return header.height;
    }

    std::vector<primitives::RollupId> rollupIds() const;

    /// View served to `rollup_id` by the sequencer
    primitives::FilteredSequencerBlock filter(
        const primitives::RollupId &rollup_id) const;

    /// Header blob posted to the DA network
    primitives::SubmittedMetadata metadata() const;

    /// Rollup blob posted to the DA network, none if the rollup is absent
    std::optional<primitives::SubmittedRollupData> rollupData(
        const primitives::RollupId &rollup_id) const;
  };

  /**
   * Commits `rollups` into a block: computes both roots, the data hash over
   * them followed by `extra_data`, the proofs and the block hash
   */
  SequencerBlock buildBlock(std::string chain_id,
                            primitives::SequencerHeight height,
                            primitives::Timestamp time,
                            RollupTransactionsMap rollups,
                            const std::vector<common::Buffer> &extra_data = {});

}  // namespace conductor::devnet
