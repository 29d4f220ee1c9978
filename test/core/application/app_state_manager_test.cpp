/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <csignal>
#include <thread>

#include "application/impl/app_state_manager_impl.hpp"
#include "testutil/prepare_loggers.hpp"

using conductor::application::AppStateException;
using conductor::application::AppStateManager;
using conductor::application::AppStateManagerImpl;

using testing::Return;
using testing::Sequence;

class StageMock {
 public:
  MOCK_METHOD(bool, inject, ());
  MOCK_METHOD(bool, prepare, ());
  MOCK_METHOD(bool, start, ());
  MOCK_METHOD(void, stop, ());
};

/// Exposes the stages to drive them one by one
class SteppedAppStateManager : public AppStateManagerImpl {
 public:
  using AppStateManagerImpl::doInject;
  using AppStateManagerImpl::doLaunch;
  using AppStateManagerImpl::doPrepare;
  using AppStateManagerImpl::doShutdown;
};

class AppStateManagerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    manager_ = std::make_shared<SteppedAppStateManager>();
  }

  void TearDown() override {
    manager_.reset();
  }

  std::shared_ptr<SteppedAppStateManager> manager_;
  testing::StrictMock<StageMock> stages_;
};

/**
 * @given new created AppStateManager
 * @when switch stages in order
 * @then state changes according to the order
 */
TEST_F(AppStateManagerTest, StateSequence_Normal) {
  ASSERT_EQ(manager_->state(), AppStateManager::State::Init);
  ASSERT_NO_THROW(manager_->doInject());
  ASSERT_EQ(manager_->state(), AppStateManager::State::Injected);
  ASSERT_NO_THROW(manager_->doPrepare());
  ASSERT_EQ(manager_->state(), AppStateManager::State::ReadyToStart);
  ASSERT_NO_THROW(manager_->doLaunch());
  ASSERT_EQ(manager_->state(), AppStateManager::State::Works);
  ASSERT_NO_THROW(manager_->doShutdown());
  ASSERT_EQ(manager_->state(), AppStateManager::State::ReadyToStop);
}

/**
 * @given AppStateManager in state 'Works' (after stage 'launch')
 * @when trying to run earlier stages again
 * @then thrown exceptions, state wasn't change, shutdown still works
 */
TEST_F(AppStateManagerTest, StateSequence_Abnormal) {
  EXPECT_THROW(manager_->doPrepare(), AppStateException);
  manager_->doInject();
  manager_->doPrepare();
  manager_->doLaunch();
  EXPECT_THROW(manager_->doInject(), AppStateException);
  EXPECT_THROW(manager_->doLaunch(), AppStateException);
  EXPECT_EQ(manager_->state(), AppStateManager::State::Works);
  EXPECT_NO_THROW(manager_->doShutdown());
  EXPECT_THROW(manager_->doShutdown(), AppStateException);
}

/**
 * @given AppStateManager in state 'Works' (after stage 'launch')
 * @when add callbacks for each stages
 * @then done without exception only for 'shutdown' stage callback
 */
TEST_F(AppStateManagerTest, AddCallback_AfterLaunch) {
  manager_->doInject();
  manager_->doPrepare();
  manager_->doLaunch();
  EXPECT_THROW(manager_->atInject([] { return true; }), AppStateException);
  EXPECT_THROW(manager_->atPrepare([] { return true; }), AppStateException);
  EXPECT_THROW(manager_->atLaunch([] { return true; }), AppStateException);
  EXPECT_NO_THROW(manager_->atShutdown([] {}));
}

/**
 * @given an object with all stage methods under control
 * @when stages run in order
 * @then each method is called at its stage
 */
TEST_F(AppStateManagerTest, TakeControl) {
  manager_->takeControl(stages_);

  Sequence seq;
  EXPECT_CALL(stages_, inject()).InSequence(seq).WillOnce(Return(true));
  EXPECT_CALL(stages_, prepare()).InSequence(seq).WillOnce(Return(true));
  EXPECT_CALL(stages_, start()).InSequence(seq).WillOnce(Return(true));
  EXPECT_CALL(stages_, stop()).InSequence(seq);

  manager_->doInject();
  manager_->doPrepare();
  manager_->doLaunch();
  manager_->doShutdown();
}

/**
 * @given an object failing its inject stage
 * @when the manager runs
 * @then later stages are skipped and shutdown callbacks still run
 */
TEST_F(AppStateManagerTest, FailedStageShutsDown) {
  manager_->takeControl(stages_);

  EXPECT_CALL(stages_, inject()).WillOnce(Return(false));
  EXPECT_CALL(stages_, stop());

  EXPECT_NO_THROW(manager_->run());
  EXPECT_EQ(manager_->state(), AppStateManager::State::ReadyToStop);
}

/**
 * @given a running AppStateManager
 * @when shutdown is requested from another thread
 * @then run returns after the shutdown callbacks
 */
TEST_F(AppStateManagerTest, ShutdownFromAnotherThread) {
  manager_->takeControl(stages_);
  EXPECT_CALL(stages_, inject()).WillOnce(Return(true));
  EXPECT_CALL(stages_, prepare()).WillOnce(Return(true));
  EXPECT_CALL(stages_, start()).WillOnce([this] {
    std::thread([manager = manager_] { manager->shutdown(); }).detach();
    return true;
  });
  EXPECT_CALL(stages_, stop());

  std::thread main([&] { EXPECT_NO_THROW(manager_->run()); });
  main.join();
  EXPECT_EQ(manager_->state(), AppStateManager::State::ReadyToStop);
}

/**
 * @given a running AppStateManager
 * @when the process receives SIGQUIT
 * @then the manager shuts down
 */
TEST_F(AppStateManagerTest, ShutdownOnSignal) {
  manager_->takeControl(stages_);
  EXPECT_CALL(stages_, inject()).WillOnce(Return(true));
  EXPECT_CALL(stages_, prepare()).WillOnce(Return(true));
  EXPECT_CALL(stages_, start()).WillOnce([] {
    std::thread terminator([] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      raise(SIGQUIT);
    });
    terminator.join();
    return true;
  });
  EXPECT_CALL(stages_, stop());

  std::thread main([&] { EXPECT_NO_THROW(manager_->run()); });
  main.join();
}

/**
 * @given AppStateManager not owned by a shared pointer
 * @when it is run
 * @then it refuses
 */
TEST(AppStateManagerOwnershipTest, RunRequiresSharedOwnership) {
  testutil::prepareLoggers();
  AppStateManagerImpl unowned;
  EXPECT_THROW(unowned.run(), std::logic_error);
}
