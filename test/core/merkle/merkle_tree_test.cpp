/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merkle/merkle_tree.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using conductor::common::Buffer;
using conductor::common::Hash256;
using namespace conductor::merkle;

namespace {
  // leaves of the certificate transparency reference tree
  std::vector<Buffer> referenceLeaves() {
    std::vector<Buffer> leaves;
    for (auto hex : {"",
                     "00",
                     "10",
                     "2021",
                     "3031",
                     "40414243",
                     "5051525354555657",
                     "606162636465666768696a6b6c6d6e6f"}) {
      leaves.emplace_back(Buffer::fromHex(hex).value());
    }
    return leaves;
  }

  Hash256 hash(std::string_view hex) {
    return Hash256::fromHex(hex).value();
  }
}  // namespace

/**
 * @given no leaves
 * @when root is calculated
 * @then it is the hash of the empty string
 */
TEST(MerkleTreeTest, EmptyTreeRoot) {
  MerkleTree tree;
  EXPECT_EQ(
      tree.root(),
      hash("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
  EXPECT_EQ(tree.root(), emptyTreeHash());
  EXPECT_FALSE(tree.prove(0).has_value());
}

/**
 * @given the reference leaves
 * @when roots of the first one and of all of them are calculated
 * @then they match the published vectors
 */
TEST(MerkleTreeTest, ReferenceRoots) {
  auto leaves = referenceLeaves();
  EXPECT_EQ(
      hashLeaf(leaves[0]),
      hash("6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d"));
  EXPECT_EQ(
      root(leaves),
      hash("5dc9da79a70659a9ad559cb701ded9a2ab9d823aad2f4960cfe370eff4604328"));
}

/**
 * @given trees of every size up to the reference size
 * @when each leaf is proven
 * @then the proof verifies against the root and has the expected length
 */
TEST(MerkleTreeTest, ProofsOfEveryLeafVerify) {
  auto leaves = referenceLeaves();
  for (size_t size = 1; size <= leaves.size(); ++size) {
    MerkleTree tree;
    for (size_t i = 0; i < size; ++i) {
      tree.push(leaves[i]);
    }
    auto tree_root = tree.root();
    for (size_t i = 0; i < size; ++i) {
      auto proof = tree.prove(i);
      ASSERT_TRUE(proof.has_value()) << "size " << size << " index " << i;
      EXPECT_EQ(proof->audit_path.size(), auditPathLength(i, size));
      EXPECT_TRUE(verify(leaves[i], *proof, tree_root))
          << "size " << size << " index " << i;
    }
    EXPECT_FALSE(tree.prove(size).has_value());
  }
}

/**
 * @given a valid proof
 * @when leaf, index or path are tampered, or any single bit of a path hash,
 * the root or the leaf is flipped
 * @then the check reports the failure
 */
TEST(MerkleTreeTest, TamperedProofIsRejected) {
  auto leaves = referenceLeaves();
  auto tree = MerkleTree::fromLeaves(leaves);
  auto tree_root = tree.root();
  auto proof = tree.prove(3).value();

  EXPECT_EC(check(leaves[4], proof, tree_root), ProofError::ROOT_MISMATCH);

  auto moved = proof;
  moved.leaf_index = 2;
  EXPECT_EC(check(leaves[3], moved, tree_root), ProofError::ROOT_MISMATCH);

  auto out_of_range = proof;
  out_of_range.leaf_index = leaves.size();
  EXPECT_EC(check(leaves[3], out_of_range, tree_root),
            ProofError::INDEX_OUT_OF_RANGE);

  auto longer = proof;
  longer.audit_path.push_back(tree_root);
  EXPECT_EC(check(leaves[3], longer, tree_root), ProofError::BAD_PATH_LENGTH);

  auto shorter = proof;
  shorter.audit_path.pop_back();
  EXPECT_FALSE(verify(leaves[3], shorter, tree_root));

  auto empty = proof;
  empty.tree_size = 0;
  EXPECT_EC(check(leaves[3], empty, tree_root), ProofError::EMPTY_TREE);

  ASSERT_FALSE(proof.audit_path.empty());
  for (size_t i = 0; i < proof.audit_path.size(); ++i) {
    for (size_t byte = 0; byte < Hash256::size(); ++byte) {
      auto flipped = proof;
      flipped.audit_path[i][byte] ^= 0x01;
      EXPECT_FALSE(verify(leaves[3], flipped, tree_root))
          << "path hash " << i << " byte " << byte;
    }
  }
  for (size_t byte = 0; byte < Hash256::size(); ++byte) {
    auto flipped_root = tree_root;
    flipped_root[byte] ^= 0x01;
    EXPECT_FALSE(verify(leaves[3], proof, flipped_root))
        << "root byte " << byte;
  }
  auto flipped_leaf = leaves[3];
  ASSERT_FALSE(flipped_leaf.empty());
  flipped_leaf[0] ^= 0x01;
  EXPECT_FALSE(verify(flipped_leaf, proof, tree_root));

  EXPECT_OUTCOME_TRUE_1(check(leaves[3], proof, tree_root));
}
