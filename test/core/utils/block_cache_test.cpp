/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/block_cache.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using conductor::BlockCache;
using conductor::BlockCacheError;

namespace {
  struct Item {
    uint64_t h;
    uint64_t height() const {
      return h;
    }
  };
}  // namespace

/**
 * @given a cache expecting height 10
 * @when blocks arrive as 12, 10, 11
 * @then they are released as 10, 11, 12
 */
TEST(BlockCacheTest, ReleasesInOrder) {
  BlockCache<Item> cache{10, 8};
  EXPECT_OUTCOME_TRUE_1(cache.insert({12}));
  EXPECT_FALSE(cache.pop().has_value());
  EXPECT_OUTCOME_TRUE_1(cache.insert({10}));
  EXPECT_OUTCOME_TRUE_1(cache.insert({11}));

  for (uint64_t expected : {10, 11, 12}) {
    auto item = cache.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->height(), expected);
  }
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.nextHeight(), 13);
}

/**
 * @given a cache with a released block
 * @when a stale or duplicate block is inserted
 * @then insertion fails
 */
TEST(BlockCacheTest, RejectsStaleAndDuplicate) {
  BlockCache<Item> cache{1, 8};
  EXPECT_OUTCOME_TRUE_1(cache.insert({1}));
  ASSERT_TRUE(cache.pop().has_value());
  EXPECT_EC(cache.insert({1}), BlockCacheError::BELOW_NEXT_HEIGHT);
  EXPECT_OUTCOME_TRUE_1(cache.insert({3}));
  EXPECT_EC(cache.insert({3}), BlockCacheError::ALREADY_CACHED);
}

/**
 * @given a full cache
 * @when a block other than the next one arrives
 * @then it is refused, while the next block is still accepted
 */
TEST(BlockCacheTest, FullCacheAcceptsOnlyNext) {
  BlockCache<Item> cache{1, 2};
  EXPECT_OUTCOME_TRUE_1(cache.insert({3}));
  EXPECT_OUTCOME_TRUE_1(cache.insert({4}));
  EXPECT_EC(cache.insert({5}), BlockCacheError::FULL);
  EXPECT_OUTCOME_TRUE_1(cache.insert({1}));
  EXPECT_EQ(cache.size(), 3);

  cache.reset(7);
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.nextHeight(), 7);
}
