/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <span>
#include <vector>

#include "merkle/merkle_tree.hpp"
#include "primitives/common.hpp"

namespace conductor::primitives {

  /// Index of `rollup_transactions_root` among the block data items
  constexpr uint64_t kRollupTransactionsRootIndex = 0;
  /// Index of `rollup_ids_root` among the block data items
  constexpr uint64_t kRollupIdsRootIndex = 1;

  /// Merkle Tree Hash of transactions
  common::Hash256 transactionsRoot(std::span<const Transaction> transactions);

  /// Leaf of one rollup in the rollup transactions tree:
  /// rollup_id || MTH(transactions)
  common::Buffer rollupTransactionsLeaf(
      const RollupId &rollup_id, std::span<const Transaction> transactions);

  /// Root over all rollups of a block, leaves ordered by rollup id
  common::Hash256 rollupTransactionsRoot(
      const std::map<RollupId, std::vector<Transaction>> &rollups);

  /// Merkle Tree Hash of rollup ids, in the given order
  common::Hash256 rollupIdsRoot(std::span<const RollupId> rollup_ids);

  /**
   * Tree whose leaves are the SHA-256 of the block data items. Its root is
   * the header's `data_hash`.
   */
  merkle::MerkleTree dataTree(std::span<const common::Buffer> data_items);

  /// Data hash over already hashed data items
  common::Hash256 rootOfHashes(std::span<const common::Hash256> item_hashes);

}  // namespace conductor::primitives
