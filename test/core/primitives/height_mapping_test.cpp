/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/height_mapping.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace conductor::primitives;

class HeightMappingTest : public testing::Test {
 protected:
  ExecutionSessionParameters params_{
      .rollup_start_block_number = 1,
      .rollup_end_block_number = 0,
      .sequencer_start_block_height = 100,
  };
};

/**
 * @given a session starting rollup block 1 at sequencer height 100
 * @when block numbers are mapped
 * @then sequencer heights are offset by 99
 */
TEST_F(HeightMappingTest, MapsBothWays) {
  EXPECT_OUTCOME_TRUE(first, sequencerHeightOf(params_, 1));
  EXPECT_EQ(first, 100);
  EXPECT_OUTCOME_TRUE(tenth, sequencerHeightOf(params_, 10));
  EXPECT_EQ(tenth, 109);
  EXPECT_OUTCOME_TRUE(number, rollupNumberOf(params_, 109));
  EXPECT_EQ(number, 10);
}

/**
 * @given the block preceding the session
 * @when it is mapped
 * @then it maps to the height before the first one, and the next height to
 * fetch is the first one
 */
TEST_F(HeightMappingTest, BlockBeforeSession) {
  EXPECT_OUTCOME_TRUE(base, sequencerHeightOf(params_, 0));
  EXPECT_EQ(base, 99);
  EXPECT_OUTCOME_TRUE(next, nextSequencerHeight(params_, 0));
  EXPECT_EQ(next, 100);
  EXPECT_OUTCOME_TRUE(after_first, nextSequencerHeight(params_, 1));
  EXPECT_EQ(after_first, 101);
}

/**
 * @given a session starting later than rollup block 1
 * @when earlier blocks or heights are mapped
 * @then mapping fails
 */
TEST_F(HeightMappingTest, OutOfSession) {
  params_.rollup_start_block_number = 5;
  EXPECT_EC(sequencerHeightOf(params_, 2), MappingError::BEFORE_SESSION_START);
  EXPECT_EC(rollupNumberOf(params_, 99), MappingError::BELOW_SEQUENCER_START);
  EXPECT_EC(
      sequencerHeightOf(params_, std::numeric_limits<BlockNumber>::max()),
      MappingError::BEFORE_SESSION_START);
}

/**
 * @given bounded and unbounded sessions
 * @when the stop height is asked
 * @then it is the height of the last block only for the bounded one
 */
TEST_F(HeightMappingTest, StopHeight) {
  EXPECT_FALSE(sequencerStopHeight(params_).has_value());
  params_.rollup_end_block_number = 10;
  EXPECT_EQ(sequencerStopHeight(params_), 109);
}
