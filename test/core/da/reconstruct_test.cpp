/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/reconstruct.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "da/blob_codec.hpp"
#include "devnet/block_builder.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace conductor;
using common::Buffer;
using primitives::CelestiaBlob;
using primitives::RollupId;

class ReconstructTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  devnet::SequencerBlock block(primitives::SequencerHeight height,
                               bool with_rollup) {
    devnet::RollupTransactionsMap rollups{
        {other_, {Buffer::fromString("foreign")}},
    };
    if (with_rollup) {
      rollups.emplace(rollup_,
                      std::vector<Buffer>{
                          Buffer::fromString(fmt::format("tx@{}", height))});
    }
    return devnet::buildBlock(
        kChainId, height, {.seconds = int64_t(height)}, std::move(rollups));
  }

  static Buffer headerBlob(const devnet::SequencerBlock &b) {
    return da::encodeBlob(CelestiaBlob{b.metadata()}).value();
  }

  Buffer rollupBlob(const devnet::SequencerBlock &b) const {
    return da::encodeBlob(CelestiaBlob{b.rollupData(rollup_).value()}).value();
  }

  static constexpr auto kChainId = "test-sequencer";
  RollupId rollup_{crypto::sha256("astria")};
  RollupId other_{crypto::sha256("other")};
  da::BlockReconstructor reconstructor_{
      std::make_shared<normalizer::BlockNormalizer>(rollup_), kChainId};
};

/**
 * @given header and rollup blobs of three blocks, one without the rollup,
 * posted out of order
 * @when they are reconstructed
 * @then three blocks ordered by height come out, with the rollup data
 * attached where present
 */
TEST_F(ReconstructTest, RebuildsBlocksInHeightOrder) {
  auto b1 = block(1, true);
  auto b2 = block(2, false);
  auto b3 = block(3, true);

  auto res = reconstructor_.reconstruct(
      10,
      {headerBlob(b3), headerBlob(b1), headerBlob(b2)},
      {rollupBlob(b3), rollupBlob(b1)});

  EXPECT_EQ(res.celestia_height, 10);
  ASSERT_EQ(res.blocks.size(), 3);
  EXPECT_EQ(res.blocks[0].height(), 1);
  EXPECT_EQ(res.blocks[1].height(), 2);
  EXPECT_EQ(res.blocks[2].height(), 3);
  ASSERT_TRUE(res.blocks[0].rollup_transactions.has_value());
  EXPECT_EQ(res.blocks[0].rollup_transactions->transactions,
            std::vector<Buffer>{Buffer::fromString("tx@1")});
  EXPECT_FALSE(res.blocks[1].rollup_transactions.has_value());
  EXPECT_EQ(res.censored, 0);
  EXPECT_EQ(res.unmatched_rollup_blobs, 0);
  EXPECT_EQ(res.rejected_blobs, 0);
}

/**
 * @given a header blob listing the rollup without its rollup blob
 * @when it is reconstructed
 * @then the block is dropped as censored
 */
TEST_F(ReconstructTest, WithheldRollupDataIsCensorship) {
  auto b1 = block(1, true);
  auto res = reconstructor_.reconstruct(10, {headerBlob(b1)}, {});
  EXPECT_TRUE(res.blocks.empty());
  EXPECT_EQ(res.censored, 1);
}

/**
 * @given a rollup blob whose header blob is missing
 * @when it is reconstructed
 * @then the blob is counted as unmatched
 */
TEST_F(ReconstructTest, RollupBlobWithoutHeader) {
  auto b1 = block(1, true);
  auto b2 = block(2, true);
  auto res = reconstructor_.reconstruct(
      10, {headerBlob(b2)}, {rollupBlob(b1), rollupBlob(b2)});
  ASSERT_EQ(res.blocks.size(), 1);
  EXPECT_EQ(res.blocks[0].height(), 2);
  EXPECT_EQ(res.unmatched_rollup_blobs, 1);
}

/**
 * @given garbage, a header of another chain and a header with a broken
 * data hash
 * @when they are reconstructed
 * @then garbage and broken blobs are rejected, the other chain is ignored
 */
TEST_F(ReconstructTest, RejectsBadBlobs) {
  auto foreign = devnet::buildBlock("other-chain", 1, {}, {});
  auto broken = block(2, false);
  broken.header.data_hash = crypto::sha256("broken");

  auto res = reconstructor_.reconstruct(
      10,
      {Buffer::fromString("not a blob"),
       headerBlob(foreign),
       headerBlob(broken)},
      {});
  EXPECT_TRUE(res.blocks.empty());
  EXPECT_EQ(res.rejected_blobs, 2);
}

/**
 * @given the same header blob posted twice
 * @when it is reconstructed
 * @then one block comes out
 */
TEST_F(ReconstructTest, DuplicateHeaderBlob) {
  auto b1 = block(1, false);
  auto res =
      reconstructor_.reconstruct(10, {headerBlob(b1), headerBlob(b1)}, {});
  ASSERT_EQ(res.blocks.size(), 1);
  EXPECT_EQ(res.blocks[0].block_hash, b1.block_hash);
}
