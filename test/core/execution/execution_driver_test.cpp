/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "execution/execution_driver.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "devnet/devnet_error.hpp"
#include "mock/execution/execution_client_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace conductor;
using execution::ExecutionClientError;
using execution::ExecutionClientMock;
using execution::ExecutionDriver;
using execution::ExecutionError;
using primitives::CandidateBlock;
using primitives::ExecutedBlockMetadata;
using testing::_;
using testing::Return;
using namespace std::chrono_literals;

class ExecutionDriverTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    client_ = std::make_shared<ExecutionClientMock>();
    driver_ = std::make_shared<ExecutionDriver>(
        client_,
        RetryPolicy{.initial_delay = 1ms, .max_attempts = 3},
        std::make_shared<Cancellation>());

    genesis_.number = 0;
    genesis_.hash = crypto::sha256("genesis");

    candidate_.block_hash = crypto::sha256("sequencer block 100");
    candidate_.header.height = 100;
    candidate_.header.time = {.seconds = 1700000000};
    candidate_.transactions = {common::Buffer::fromString("tx")};
  }

  void openSession() {
    EXPECT_CALL(*client_, initExecutionSession())
        .WillOnce(Return(primitives::ExecutionSession{
            .session_id = "session-1",
            .parameters = {},
        }));
    ASSERT_OUTCOME_SUCCESS_TRY(driver_->initSession());
    driver_->setHead(genesis_);
  }

  ExecutedBlockMetadata child(const ExecutedBlockMetadata &parent) const {
    return {
        .number = parent.number + 1,
        .hash = crypto::sha256(fmt::format("block {}", parent.number + 1)),
        .parent_hash = parent.hash,
        .timestamp = candidate_.header.time,
    };
  }

  std::shared_ptr<ExecutionClientMock> client_;
  std::shared_ptr<ExecutionDriver> driver_;
  ExecutedBlockMetadata genesis_;
  CandidateBlock candidate_;
};

/**
 * @given an open session
 * @when a block is executed on top of the head
 * @then the engine is called with the candidate and the head moves to the
 * result, stamped with the sequencer block it came from
 */
TEST_F(ExecutionDriverTest, ExecutesOnHead) {
  openSession();
  EXPECT_CALL(*client_,
              executeBlock("session-1",
                           genesis_.hash,
                           candidate_.transactions,
                           candidate_.header.time,
                           candidate_.block_hash))
      .WillOnce(Return(child(genesis_)));

  EXPECT_OUTCOME_TRUE(executed, driver_->execute(genesis_, candidate_));
  EXPECT_EQ(executed.number, 1);
  EXPECT_EQ(executed.sequencer_block_hash, candidate_.block_hash);
  EXPECT_EQ(executed.sequencer_height, 100);
  EXPECT_EQ(driver_->head(), executed);
}

/**
 * @given no session
 * @when a block is executed
 * @then the driver refuses without calling the engine
 */
TEST_F(ExecutionDriverTest, RequiresSession) {
  EXPECT_CALL(*client_, executeBlock(_, _, _, _, _)).Times(0);
  EXPECT_EC(driver_->execute(genesis_, candidate_), ExecutionError::NO_SESSION);
}

/**
 * @given a parent other than the head
 * @when a block is executed on it
 * @then an ordering fault is reported without calling the engine
 */
TEST_F(ExecutionDriverTest, RefusesParentOtherThanHead) {
  openSession();
  EXPECT_CALL(*client_, executeBlock(_, _, _, _, _)).Times(0);
  EXPECT_EC(driver_->execute(child(genesis_), candidate_),
            ExecutionError::ORDERING_FAULT);
}

/**
 * @given an engine returning inconsistent blocks
 * @when blocks are executed
 * @then the responses are rejected and the head does not move
 */
TEST_F(ExecutionDriverTest, ChecksResponses) {
  openSession();
  auto skipped = child(genesis_);
  skipped.number = 2;
  auto orphan = child(genesis_);
  orphan.parent_hash = crypto::sha256("elsewhere");
  EXPECT_CALL(*client_, executeBlock(_, _, _, _, _))
      .WillOnce(Return(skipped))
      .WillOnce(Return(orphan));

  EXPECT_EC(driver_->execute(genesis_, candidate_),
            ExecutionError::WRONG_BLOCK);
  EXPECT_EC(driver_->execute(genesis_, candidate_),
            ExecutionError::WRONG_PARENT);
  EXPECT_EQ(driver_->head(), genesis_);
}

/**
 * @given an engine failing once
 * @when a block is executed
 * @then the call is retried
 */
TEST_F(ExecutionDriverTest, RetriesTransientFailures) {
  openSession();
  EXPECT_CALL(*client_, executeBlock(_, _, _, _, _))
      .WillOnce(Return(devnet::DevnetError::UNAVAILABLE))
      .WillOnce(Return(child(genesis_)));
  EXPECT_OUTCOME_TRUE(executed, driver_->execute(genesis_, candidate_));
  EXPECT_EQ(executed.number, 1);
}

/**
 * @given an engine whose head is not the driver's head
 * @when a block is executed
 * @then the engine is asked once and an ordering fault is reported, leaving
 * the head in place
 */
TEST_F(ExecutionDriverTest, ParentMismatchIsAnOrderingFault) {
  driver_ = std::make_shared<ExecutionDriver>(
      client_,
      RetryPolicy{.initial_delay = 1ms, .max_delay = 1ms},
      std::make_shared<Cancellation>());
  openSession();
  EXPECT_CALL(*client_, executeBlock(_, _, _, _, _))
      .WillOnce(Return(ExecutionClientError::PARENT_MISMATCH));
  EXPECT_EC(driver_->execute(genesis_, candidate_),
            ExecutionError::ORDERING_FAULT);
  EXPECT_EQ(driver_->head(), genesis_);
}

/**
 * @given an engine rolling back to a wrong block
 * @when rollback is requested
 * @then it is reported as a wrong block
 */
TEST_F(ExecutionDriverTest, ChecksRollbackTarget) {
  openSession();
  EXPECT_CALL(*client_, rollback(0))
      .WillOnce(Return(child(genesis_)))
      .WillOnce(Return(genesis_));
  EXPECT_EC(driver_->rollback(0), ExecutionError::WRONG_BLOCK);
  EXPECT_OUTCOME_TRUE(head, driver_->rollback(0));
  EXPECT_EQ(head, genesis_);
  EXPECT_EQ(driver_->head(), genesis_);
}

/**
 * @given an open session
 * @when a commitment state is forwarded
 * @then the engine receives it under the session id
 */
TEST_F(ExecutionDriverTest, ForwardsCommitmentState) {
  openSession();
  primitives::CommitmentState state{
      .soft = genesis_,
      .firm = genesis_,
      .lowest_celestia_search_height = 10,
  };
  EXPECT_CALL(*client_, updateCommitmentState("session-1", state))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS_TRY(driver_->updateCommitmentState(state));
}
