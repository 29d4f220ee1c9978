/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "normalizer/block_normalizer.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "devnet/block_builder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace conductor;
using common::Buffer;
using normalizer::BlockNormalizer;
using normalizer::NormalizeError;
using primitives::Origin;
using primitives::RollupId;

class BlockNormalizerTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    block_ = devnet::buildBlock(
        "test-sequencer",
        7,
        {.seconds = 1700000000, .nanos = 0},
        {
            {rollup_, {Buffer::fromString("tx-1"), Buffer::fromString("tx-2")}},
            {other_, {Buffer::fromString("foreign")}},
        },
        {Buffer::fromString("extra data item")});
  }

  RollupId rollup_{crypto::sha256("astria")};
  RollupId other_{crypto::sha256("other")};
  RollupId absent_{crypto::sha256("absent")};
  BlockNormalizer normalizer_{rollup_};
  devnet::SequencerBlock block_;
};

/**
 * @given a block with transactions of two rollups
 * @when it is normalized for one of them
 * @then the candidate carries only that rollup's transactions
 */
TEST_F(BlockNormalizerTest, AcceptsValidBlock) {
  EXPECT_OUTCOME_TRUE(candidate,
                      normalizer_.normalize(block_.filter(rollup_),
                                            Origin::Soft));
  EXPECT_EQ(candidate.origin, Origin::Soft);
  EXPECT_EQ(candidate.height(), 7);
  EXPECT_EQ(candidate.block_hash, block_.block_hash);
  EXPECT_EQ(candidate.rollup_id, rollup_);
  ASSERT_EQ(candidate.transactions.size(), 2);
  EXPECT_EQ(candidate.transactions[0], Buffer::fromString("tx-1"));
  EXPECT_EQ(candidate.all_rollup_ids.size(), 2);
}

/**
 * @given a block without the rollup's transactions
 * @when it is normalized for that rollup
 * @then the candidate is empty
 */
TEST_F(BlockNormalizerTest, AcceptsBlockWithoutRollup) {
  BlockNormalizer normalizer{absent_};
  EXPECT_OUTCOME_TRUE(candidate,
                      normalizer.normalize(block_.filter(absent_),
                                           Origin::Firm));
  EXPECT_TRUE(candidate.transactions.empty());
  EXPECT_EQ(candidate.origin, Origin::Firm);
}

/**
 * @given a block whose transactions were altered
 * @when it is normalized
 * @then it is rejected as not belonging to the rollup
 */
TEST_F(BlockNormalizerTest, RejectsAlteredTransactions) {
  auto filtered = block_.filter(rollup_);
  filtered.rollup_transactions->transactions.push_back(
      Buffer::fromString("injected"));
  EXPECT_EC(normalizer_.normalize(filtered, Origin::Soft),
            NormalizeError::WRONG_ROLLUP);
}

/**
 * @given a block whose transactions root was replaced
 * @when it is normalized
 * @then the root is not proven against the data hash
 */
TEST_F(BlockNormalizerTest, RejectsBadRootProof) {
  auto filtered = block_.filter(rollup_);
  filtered.header.rollup_transactions_root = crypto::sha256("forged");
  EXPECT_EC(normalizer_.normalize(filtered, Origin::Soft),
            NormalizeError::BAD_PROOF);

  auto moved = block_.filter(rollup_);
  moved.rollup_transactions_proof.leaf_index = 2;
  EXPECT_EC(normalizer_.normalize(moved, Origin::Soft),
            NormalizeError::BAD_PROOF);
}

/**
 * @given a block whose rollup id list was tampered with
 * @when it is normalized
 * @then the ids are not proven
 */
TEST_F(BlockNormalizerTest, RejectsTamperedRollupIds) {
  auto filtered = block_.filter(rollup_);
  filtered.all_rollup_ids.push_back(absent_);
  EXPECT_EC(normalizer_.normalize(filtered, Origin::Soft),
            NormalizeError::MISSING_IDS_PROOF);
}

/**
 * @given a block served without the rollup's transactions although the
 * rollup is listed
 * @when it is normalized
 * @then it is rejected
 */
TEST_F(BlockNormalizerTest, RejectsWithheldTransactions) {
  auto filtered = block_.filter(rollup_);
  filtered.rollup_transactions.reset();
  EXPECT_EC(normalizer_.normalize(filtered, Origin::Firm),
            NormalizeError::WRONG_ROLLUP);
}

/**
 * @given transactions of another rollup
 * @when they are presented as the rollup's
 * @then they are rejected
 */
TEST_F(BlockNormalizerTest, RejectsForeignTransactions) {
  auto filtered = block_.filter(other_);
  EXPECT_EC(normalizer_.normalize(filtered, Origin::Soft),
            NormalizeError::WRONG_ROLLUP);
}
