/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/commitments.hpp"

#include "crypto/sha/sha256.hpp"

namespace conductor::primitives {

  common::Hash256 transactionsRoot(std::span<const Transaction> transactions) {
    return merkle::root(transactions);
  }

  common::Buffer rollupTransactionsLeaf(
      const RollupId &rollup_id, std::span<const Transaction> transactions) {
    common::Buffer leaf;
    leaf.put(rollup_id);
    leaf.put(transactionsRoot(transactions));
    return leaf;
  }

  common::Hash256 rollupTransactionsRoot(
      const std::map<RollupId, std::vector<Transaction>> &rollups) {
    merkle::MerkleTree tree;
    for (auto &[id, txs] : rollups) {
      tree.push(rollupTransactionsLeaf(id, txs));
    }
    return tree.root();
  }

  common::Hash256 rollupIdsRoot(std::span<const RollupId> rollup_ids) {
    merkle::MerkleTree tree;
    for (auto &id : rollup_ids) {
      tree.push(id);
    }
    return tree.root();
  }

  merkle::MerkleTree dataTree(std::span<const common::Buffer> data_items) {
    merkle::MerkleTree tree;
    for (auto &item : data_items) {
      tree.push(crypto::sha256(item));
    }
    return tree;
  }

  common::Hash256 rootOfHashes(std::span<const common::Hash256> item_hashes) {
    return merkle::root(item_hashes);
  }

}  // namespace conductor::primitives
