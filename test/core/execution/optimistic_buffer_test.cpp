/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "execution/optimistic_buffer.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace conductor;
using execution::OptimisticBuffer;
using execution::OptimisticError;
using primitives::CandidateBlock;
using primitives::RollupId;

class OptimisticBufferTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  CandidateBlock block(primitives::SequencerHeight height) const {
    CandidateBlock block;
    block.block_hash = crypto::sha256(fmt::format("sequencer {}", height));
    block.header.height = height;
    block.rollup_id = rollup_;
    return block;
  }

  RollupId rollup_{crypto::sha256("rollup")};
  OptimisticBuffer buffer_{rollup_, 3};
};

/**
 * @given an empty buffer
 * @when soft blocks arrive
 * @then the latest one is exposed and each can be taken once
 */
TEST_F(OptimisticBufferTest, KeepsBlocksByHash) {
  EXPECT_FALSE(buffer_.latest());
  ASSERT_OUTCOME_SUCCESS_TRY(buffer_.onSoftCandidate(block(1)));
  ASSERT_OUTCOME_SUCCESS_TRY(buffer_.onSoftCandidate(block(2)));

  ASSERT_TRUE(buffer_.latest());
  EXPECT_EQ(buffer_.latest()->height(), 2);

  auto taken = buffer_.take(block(1).block_hash);
  ASSERT_TRUE(taken);
  EXPECT_EQ(taken->height(), 1);
  EXPECT_FALSE(buffer_.take(block(1).block_hash));
  EXPECT_EQ(buffer_.size(), 1);
}

/**
 * @given a block of another rollup, and a block already buffered
 * @when they arrive
 * @then both are rejected
 */
TEST_F(OptimisticBufferTest, RejectsForeignAndDuplicate) {
  auto foreign = block(1);
  foreign.rollup_id = RollupId{crypto::sha256("other")};
  EXPECT_EC(buffer_.onSoftCandidate(foreign), OptimisticError::WRONG_ROLLUP);

  ASSERT_OUTCOME_SUCCESS_TRY(buffer_.onSoftCandidate(block(1)));
  EXPECT_EC(buffer_.onSoftCandidate(block(1)), OptimisticError::DUPLICATE);
  EXPECT_EQ(buffer_.size(), 1);
}

/**
 * @given a full buffer
 * @when another block arrives
 * @then the oldest one is evicted
 */
TEST_F(OptimisticBufferTest, EvictsOldest) {
  for (primitives::SequencerHeight height = 1; height <= 4; ++height) {
    ASSERT_OUTCOME_SUCCESS_TRY(buffer_.onSoftCandidate(block(height)));
  }
  EXPECT_EQ(buffer_.size(), 3);
  EXPECT_FALSE(buffer_.take(block(1).block_hash));
  EXPECT_TRUE(buffer_.take(block(2).block_hash));
  EXPECT_EQ(buffer_.latest()->height(), 4);
}
