/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sequencer/soft_source.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "devnet/devnet_error.hpp"
#include "devnet/loopback_sequencer.hpp"
#include "mock/sequencer/sequencer_client_mock.hpp"
#include "testutil/eventually.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace conductor;
using namespace std::chrono_literals;
using common::Buffer;
using primitives::SequencerHeight;
using reconciliation::CandidateChannel;
using sequencer::SoftSource;
using sequencer::SoftSourceError;
using testing::Return;
using testutil::eventually;

class SoftSourceTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    session_ = {
        .rollup_id = rollup_,
        .rollup_start_block_number = 1,
        .sequencer_chain_id = kChainId,
        .sequencer_start_block_height = 100,
        .celestia_chain_id = "celestia-test",
        .celestia_search_height_max_look_ahead = 50,
    };
    heights_->exclusiveAccess(
        [](state::SourceHeights &h) { h.next_soft = 100; });
    source_ = std::make_shared<SoftSource>(
        sequencer_,
        heights_,
        SoftSource::Config{
            .block_time = 10ms,
            .max_concurrent_fetches = 4,
            .retry = {.initial_delay = 1ms, .max_delay = 5ms},
        });
  }

  void TearDown() override {
    source_->stop();
  }

  void produce(SequencerHeight from, SequencerHeight to) {
    for (auto height = from; height <= to; ++height) {
      sequencer_->push(devnet::buildBlock(
          kChainId,
          height,
          {.seconds = static_cast<int64_t>(height)},
          {{rollup_,
            {Buffer::fromString(fmt::format("tx@{}", height))}}}));
    }
  }

  std::vector<SequencerHeight> received() {
    std::vector<SequencerHeight> heights;
    while (auto block = channel_->tryReceive()) {
      EXPECT_EQ(block->origin, primitives::Origin::Soft);
      EXPECT_EQ(block->rollup_id, rollup_);
      heights.push_back(block->height());
    }
    return heights;
  }

  static std::vector<SequencerHeight> range(SequencerHeight from,
                                            SequencerHeight to) {
    std::vector<SequencerHeight> heights;
    for (auto height = from; height <= to; ++height) {
      heights.push_back(height);
    }
    return heights;
  }

  static constexpr auto kChainId = "sequencer-test";
  primitives::RollupId rollup_{crypto::sha256("rollup")};
  primitives::ExecutionSessionParameters session_;
  std::shared_ptr<devnet::LoopbackSequencer> sequencer_ =
      std::make_shared<devnet::LoopbackSequencer>(kChainId);
  state::SharedSourceHeights heights_ =
      std::make_shared<SafeObject<state::SourceHeights>>();
  std::shared_ptr<CandidateChannel> channel_ =
      std::make_shared<CandidateChannel>(64);
  std::shared_ptr<SoftSource> source_;
};

/**
 * @given a sequencer with blocks 95..110 and next soft height 100
 * @when the source runs
 * @then blocks 100..110 are forwarded in height order
 */
TEST_F(SoftSourceTest, ForwardsInHeightOrder) {
  produce(95, 110);
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  ASSERT_TRUE(eventually([&] { return channel_->size() == 11; }));
  EXPECT_EQ(received(), range(100, 110));

  produce(111, 112);
  ASSERT_TRUE(eventually([&] { return channel_->size() == 2; }));
  EXPECT_EQ(received(), range(111, 112));
}

/**
 * @given a sequencer of another chain
 * @when the source starts
 * @then it refuses without fetching blocks
 */
TEST_F(SoftSourceTest, ChecksChainId) {
  session_.sequencer_chain_id = "other-chain";
  produce(100, 101);
  EXPECT_EC(source_->start(session_, channel_),
            SoftSourceError::CHAIN_ID_MISMATCH);
  EXPECT_EQ(sequencer_->filteredBlockRequests(), 0);
}

/**
 * @given a running source
 * @when it is started again
 * @then it refuses
 */
TEST_F(SoftSourceTest, StartsOnce) {
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  EXPECT_EC(source_->start(session_, std::make_shared<CandidateChannel>(1)),
            SoftSourceError::ALREADY_STARTED);
}

/**
 * @given a session ending at rollup block 3
 * @when the sequencer has blocks beyond its stop height 102
 * @then nothing above the stop height is forwarded
 */
TEST_F(SoftSourceTest, StopsAtSessionEnd) {
  session_.rollup_end_block_number = 3;
  produce(100, 106);
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  ASSERT_TRUE(eventually([&] { return channel_->size() == 3; }));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(received(), range(100, 102));
}

/**
 * @given a sequencer failing its next calls
 * @when the source runs
 * @then the failed fetches are retried and nothing is lost
 */
TEST_F(SoftSourceTest, RetriesFailedFetches) {
  produce(100, 105);
  sequencer_->failNext(4);
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  ASSERT_TRUE(eventually([&] { return channel_->size() == 6; }));
  EXPECT_EQ(received(), range(100, 105));
}

/**
 * @given soft fetching is paused
 * @when the source runs
 * @then nothing is fetched until the pause is lifted
 */
TEST_F(SoftSourceTest, HonorsPause) {
  heights_->exclusiveAccess(
      [](state::SourceHeights &h) { h.soft_paused = true; });
  produce(100, 102);
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(sequencer_->filteredBlockRequests(), 0);

  heights_->exclusiveAccess(
      [](state::SourceHeights &h) { h.soft_paused = false; });
  ASSERT_TRUE(eventually([&] { return channel_->size() == 3; }));
  EXPECT_EQ(received(), range(100, 102));
}

/**
 * @given a running source
 * @when it is stopped
 * @then its channel is closed
 */
TEST_F(SoftSourceTest, StopClosesChannel) {
  ASSERT_OUTCOME_SUCCESS_TRY(source_->start(session_, channel_));
  source_->stop();
  EXPECT_TRUE(channel_->isClosed());
}

/**
 * @given a sequencer that never answers and a policy of three attempts
 * @when the source starts
 * @then it gives up after three chain id requests
 */
TEST(SoftSourceClientTest, GivesUpOnUnreachableSequencer) {
  testutil::prepareLoggers();
  auto client = std::make_shared<sequencer::SequencerClientMock>();
  EXPECT_CALL(*client, getChainId())
      .Times(3)
      .WillRepeatedly(Return(devnet::DevnetError::UNAVAILABLE));
  EXPECT_CALL(*client, getLatestHeight()).Times(0);

  SoftSource source{
      client,
      std::make_shared<SafeObject<state::SourceHeights>>(),
      SoftSource::Config{
          .block_time = 10ms,
          .retry = {.initial_delay = 1ms,
                    .max_delay = 1ms,
                    .max_attempts = 3},
      }};
  primitives::ExecutionSessionParameters session{
      .sequencer_chain_id = "sequencer-test",
  };
  EXPECT_EC(source.start(session, std::make_shared<CandidateChannel>(4)),
            RetryError::ATTEMPTS_EXHAUSTED);
}
