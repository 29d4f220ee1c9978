/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <span>
#include <vector>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "merkle/proof.hpp"
#include "outcome/outcome.hpp"

namespace conductor::merkle {

  /**
   * Merkle Tree Hash as defined by RFC 6962 over SHA-256.
   *   leaf: H(0x00 || data)
   *   node: H(0x01 || left || right)
   *   empty tree: H("")
   * The left subtree of n > 1 leaves holds the largest power of two smaller
   * than n.
   */

  enum class ProofError : uint8_t {
    EMPTY_TREE = 1,
    INDEX_OUT_OF_RANGE,
    BAD_PATH_LENGTH,
    ROOT_MISMATCH,
  };
  Q_ENUM_ERROR_CODE(ProofError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY_TREE:
        return "Proof for an empty tree";
      case E::INDEX_OUT_OF_RANGE:
        return "Proof leaf index is out of tree range";
      case E::BAD_PATH_LENGTH:
        return "Proof audit path has wrong length for the tree size";
      case E::ROOT_MISMATCH:
        return "Reconstructed root does not match the expected one";
    }
    abort();
  }

  common::Hash256 emptyTreeHash();

  common::Hash256 hashLeaf(BufferView leaf);

  common::Hash256 hashNode(const common::Hash256 &left,
                           const common::Hash256 &right);

  /// Number of audit path entries of leaf `index` in a tree of `size` leaves
  size_t auditPathLength(uint64_t index, uint64_t size);

  /**
   * Accumulates leaves and answers root and inclusion proof queries.
   * Leaves are stored hashed, so the tree does not keep the leaf data.
   */
  class MerkleTree {
   public:
    MerkleTree() = default;

    template <typename Range>
    static MerkleTree fromLeaves(const Range &leaves) {
      MerkleTree tree;
      for (const auto &leaf : leaves) {
        tree.push(BufferView{leaf});
      }
      return tree;
    }

    void push(BufferView leaf);

    size_t size() const {
      return leaf_hashes_.size();
    }

    common::Hash256 root() const;

    /// @return nullopt if `index` is out of range
    std::optional<Proof> prove(uint64_t index) const;

   private:
    common::Hash256 subtreeRoot(size_t begin, size_t end) const;

    std::vector<common::Hash256> leaf_hashes_;
  };

  /**
   * Root of the ordered `leaves`.
   */
  template <typename Range>
  common::Hash256 root(const Range &leaves) {
    return MerkleTree::fromLeaves(leaves).root();
  }

  /**
   * Checks that `leaf` is at `proof.leaf_index` of a tree with root
   * `expected_root`.
   * @return ProofError describing the first failed check
   */
  outcome::result<void> check(BufferView leaf,
                              const Proof &proof,
                              const common::Hash256 &expected_root);

  /**
   * Same as `check`, reduced to a boolean. Never throws.
   */
  bool verify(BufferView leaf,
              const Proof &proof,
              const common::Hash256 &expected_root);

}  // namespace conductor::merkle
