/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/block_builder.hpp"

#include "crypto/sha/sha256.hpp"
#include "primitives/commitments.hpp"

namespace conductor::devnet {

  std::vector<primitives::RollupId> SequencerBlock::rollupIds() const {
    std::vector<primitives::RollupId> ids;
    ids.reserve(rollups.size());
    for (auto &[id, _] : rollups) {
      ids.push_back(id);
    }
    return ids;
  }

  primitives::FilteredSequencerBlock SequencerBlock::filter(
      const primitives::RollupId &rollup_id) const {
    primitives::FilteredSequencerBlock filtered{
        .block_hash = block_hash,
        .header = header,
        .rollup_transactions = std::nullopt,
        .all_rollup_ids = rollupIds(),
        .rollup_transactions_proof = rollup_transactions_proof,
        .rollup_ids_proof = rollup_ids_proof,
    };
    if (auto data = rollupData(rollup_id)) {
      filtered.rollup_transactions = primitives::RollupTransactions{
          .rollup_id = rollup_id,
          .transactions = std::move(data->transactions),
          .proof = std::move(data->proof),
      };
    }
    return filtered;
  }

  primitives::SubmittedMetadata SequencerBlock::metadata() const {
    return {
        .block_hash = block_hash,
        .header = header,
        .rollup_ids = rollupIds(),
        .rollup_transactions_proof = rollup_transactions_proof,
        .rollup_ids_proof = rollup_ids_proof,
    };
  }

  std::optional<primitives::SubmittedRollupData> SequencerBlock::rollupData(
      const primitives::RollupId &rollup_id) const {
    auto it = rollups.find(rollup_id);
    if (it == rollups.end()) {
      return std::nullopt;
    }
    merkle::MerkleTree tree;
    for (auto &[id, txs] : rollups) {
      tree.push(primitives::rollupTransactionsLeaf(id, txs));
    }
    auto index = std::distance(rollups.begin(), it);
    return primitives::SubmittedRollupData{
        .sequencer_block_hash = block_hash,
        .rollup_id = rollup_id,
        .transactions = it->second,
        .proof = tree.prove(index).value(),
    };
  }

  SequencerBlock buildBlock(std::string chain_id,
                            primitives::SequencerHeight height,
                            primitives::Timestamp time,
                            RollupTransactionsMap rollups,
                            const std::vector<common::Buffer> &extra_data) {
    const auto rollup_transactions_root =
        primitives::rollupTransactionsRoot(rollups);
    std::vector<primitives::RollupId> ids;
    for (auto &[id, _] : rollups) {
      ids.push_back(id);
    }
    const auto rollup_ids_root = primitives::rollupIdsRoot(ids);

    std::vector<common::Buffer> data{
        common::Buffer{rollup_transactions_root},
        common::Buffer{rollup_ids_root},
    };
    data.insert(data.end(), extra_data.begin(), extra_data.end());
    auto data_tree = primitives::dataTree(data);

    SequencerBlock block{
        .block_hash = {},
        .header =
            {
                .chain_id = std::move(chain_id),
                .height = height,
                .time = time,
                .data_hash = data_tree.root(),
                .proposer_address = {},
                .rollup_transactions_root = rollup_transactions_root,
                .rollup_ids_root = rollup_ids_root,
            },
        .rollups = std::move(rollups),
        .rollup_transactions_proof =
            data_tree.prove(primitives::kRollupTransactionsRootIndex).value(),
        .rollup_ids_proof =
            data_tree.prove(primitives::kRollupIdsRootIndex).value(),
    };
    block.block_hash = crypto::sha256(scale::encode(block.header).value());
    return block;
  }

}  // namespace conductor::devnet
