/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merkle/merkle_tree.hpp"

#include <algorithm>
#include <bit>

#include "crypto/sha/sha256.hpp"

namespace conductor::merkle {

  namespace {
    constexpr uint8_t kLeafPrefix = 0x00;
    constexpr uint8_t kNodePrefix = 0x01;

    /// Largest power of two strictly less than n, n > 1
    uint64_t splitPoint(uint64_t n) {
      return std::bit_floor(n - 1);
    }
  }  // namespace

  common::Hash256 emptyTreeHash() {
    return crypto::sha256(std::string_view{});
  }

  common::Hash256 hashLeaf(BufferView leaf) {
    const uint8_t prefix[] = {kLeafPrefix};
    return crypto::Sha256{}.update(prefix).update(leaf).finalize();
  }

  common::Hash256 hashNode(const common::Hash256 &left,
                           const common::Hash256 &right) {
    const uint8_t prefix[] = {kNodePrefix};
    return crypto::Sha256{}
        .update(prefix)
        .update(left)
        .update(right)
        .finalize();
  }

  size_t auditPathLength(uint64_t index, uint64_t size) {
    size_t length = 0;
    while (size > 1) {
      auto k = splitPoint(size);
      if (index < k) {
        size = k;
      } else {
        index -= k;
        size -= k;
      }
      ++length;
    }
    return length;
  }

  void MerkleTree::push(BufferView leaf) {
    leaf_hashes_.push_back(hashLeaf(leaf));
  }

  common::Hash256 MerkleTree::root() const {
    if (leaf_hashes_.empty()) {
      return emptyTreeHash();
    }
    return subtreeRoot(0, leaf_hashes_.size());
  }

  common::Hash256 MerkleTree::subtreeRoot(size_t begin, size_t end) const {
    if (end - begin == 1) {
      return leaf_hashes_[begin];
    }
    auto split = begin + splitPoint(end - begin);
    return hashNode(subtreeRoot(begin, split), subtreeRoot(split, end));
  }

  std::optional<Proof> MerkleTree::prove(uint64_t index) const {
    if (index >= leaf_hashes_.size()) {
      return std::nullopt;
    }
    Proof proof{
        .leaf_index = index,
        .tree_size = leaf_hashes_.size(),
    };
    // descend from the root, collecting siblings top-down
    size_t begin = 0;
    size_t end = leaf_hashes_.size();
    while (end - begin > 1) {
      auto split = begin + splitPoint(end - begin);
      if (index < split) {
        proof.audit_path.push_back(subtreeRoot(split, end));
        end = split;
      } else {
        proof.audit_path.push_back(subtreeRoot(begin, split));
        begin = split;
      }
    }
    std::reverse(proof.audit_path.begin(), proof.audit_path.end());
    return proof;
  }

  outcome::result<void> check(BufferView leaf,
                              const Proof &proof,
                              const common::Hash256 &expected_root) {
    if (proof.tree_size == 0) {
      return ProofError::EMPTY_TREE;
    }
    if (proof.leaf_index >= proof.tree_size) {
      return ProofError::INDEX_OUT_OF_RANGE;
    }
    if (proof.audit_path.size()
        != auditPathLength(proof.leaf_index, proof.tree_size)) {
      return ProofError::BAD_PATH_LENGTH;
    }

    // RFC 9162 section 2.1.3.2
    auto fn = proof.leaf_index;
    auto sn = proof.tree_size - 1;
    auto r = hashLeaf(leaf);
    for (const auto &p : proof.audit_path) {
      if (sn == 0) {
        return ProofError::BAD_PATH_LENGTH;
      }
      if ((fn & 1) == 1 or fn == sn) {
        r = hashNode(p, r);
        while ((fn & 1) == 0 and fn != 0) {
          fn >>= 1;
          sn >>= 1;
        }
      } else {
        r = hashNode(r, p);
      }
      fn >>= 1;
      sn >>= 1;
    }
    if (sn != 0 or r != expected_root) {
      return ProofError::ROOT_MISMATCH;
    }
    return outcome::success();
  }

  bool verify(BufferView leaf,
              const Proof &proof,
              const common::Hash256 &expected_root) {
    return check(leaf, proof, expected_root).has_value();
  }

}  // namespace conductor::merkle
