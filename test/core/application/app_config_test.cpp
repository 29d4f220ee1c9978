/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include <fmt/ranges.h>

#include "application/impl/app_configuration_impl.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using conductor::application::AppConfigurationImpl;
using conductor::application::StorageBackend;
using conductor::reconciliation::CommitLevel;
using conductor::reconciliation::EmptyBlockPolicy;
using std::chrono_literals::operator""ms;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::filesystem::path tmp_dir =
      std::filesystem::temp_directory_path()
      / fmt::format(
          "conductor_app_config_{}",
          testing::UnitTest::GetInstance()->current_test_info()->name());
  std::string config_path = (tmp_dir / "config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();
  std::filesystem::path base_path = tmp_dir / "base_path";

  static constexpr const char *file_content =
      R"({{
        "general" : {{
          "log": ["reconciliation=debug"]
        }},
        "storage" : {{
          "base-path" : "{}"
        }},
        "conductor" : {{
          "commit-level" : "FirmOnly",
          "empty-block-policy" : "skip",
          "celestia-block-time" : 1500,
          "channel-capacity" : 8,
          "retry-max-attempts" : 5,
          "optimistic" : true
        }},
        "devnet" : {{
          "rollup-name" : "file-rollup",
          "rollup-start" : 10,
          "sequencer-start" : 300,
          "rollback" : false
        }}
      }})";
  static constexpr const char *damaged_file_content =
      R"({
        "conductor" : {
          "commit-level" : "FirmOnly",
        "devnet" : nalizing
      })";

  void SetUp() override {
    std::filesystem::create_directories(base_path);
    ASSERT_TRUE(std::filesystem::exists(base_path));

    auto spawn_file = [](const std::string &path,
                         const std::string &file_content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << file_content;
    };
    spawn_file(config_path,
               fmt::format(fmt::runtime(file_content), base_path.native()));
    spawn_file(damaged_config_path, damaged_file_content);

    auto logger = conductor::log::createLogger("AppConfigTest", "testing");
    app_config_ = std::make_shared<AppConfigurationImpl>(logger);
  }

  void TearDown() override {
    app_config_.reset();
    std::filesystem::remove_all(tmp_dir);
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given new created AppConfigurationImpl
 * @when only the base path is provided
 * @then default values are available
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  const char *args[] = {"/path/", "--base-path", base_path.c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->basePath(), base_path);
  EXPECT_EQ(app_config_->storageBackend(), StorageBackend::InMemory);
  EXPECT_EQ(app_config_->commitLevel(), CommitLevel::SoftAndFirm);
  EXPECT_EQ(app_config_->emptyBlockPolicy(), EmptyBlockPolicy::Execute);
  EXPECT_EQ(app_config_->sequencerBlockTime(), 2000ms);
  EXPECT_EQ(app_config_->celestiaBlockTime(), 6000ms);
  EXPECT_EQ(app_config_->maxSoftFirmSpread(), 0);
  EXPECT_EQ(app_config_->maxConcurrentFetches(), 20);
  EXPECT_EQ(app_config_->channelCapacity(), 64);
  EXPECT_EQ(app_config_->retryPolicy().initial_delay, 100ms);
  EXPECT_EQ(app_config_->retryPolicy().max_delay, 20000ms);
  EXPECT_FALSE(app_config_->retryPolicy().max_attempts);
  EXPECT_EQ(app_config_->firmFailureAlertThreshold(), 10);
  EXPECT_EQ(app_config_->syncingLagThreshold(), 16);
  EXPECT_FALSE(app_config_->optimisticEnabled());
  EXPECT_EQ(app_config_->statusLogInterval(), 30000ms);
  EXPECT_EQ(app_config_->logTuning(), std::vector<std::string>());
  EXPECT_EQ(app_config_->devnet().rollup_name, "astria");
  EXPECT_TRUE(app_config_->devnet().rollback_supported);
}

/**
 * @given new created AppConfigurationImpl
 * @when conductor options are provided on the command line
 * @then they are available
 */
TEST_F(AppConfigurationTest, CommandLineTest) {
  const char *args[] = {"/path/",
                        "--database",
                        "memory",
                        "--commit-level",
                        "SoftOnly",
                        "--sequencer-block-time",
                        "500",
                        "--max-soft-firm-spread",
                        "32",
                        "--retry-initial-delay",
                        "10",
                        "--retry-max-delay",
                        "40",
                        "--retry-max-attempts",
                        "3",
                        "--optimistic",
                        "--rollup-start",
                        "5",
                        "--rollup-end",
                        "9",
                        "--look-ahead",
                        "7",
                        "--no-rollback",
                        "-lreconciliation=trace"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->storageBackend(), StorageBackend::InMemory);
  EXPECT_EQ(app_config_->commitLevel(), CommitLevel::SoftOnly);
  EXPECT_EQ(app_config_->sequencerBlockTime(), 500ms);
  EXPECT_EQ(app_config_->maxSoftFirmSpread(), 32);
  EXPECT_EQ(app_config_->retryPolicy().initial_delay, 10ms);
  EXPECT_EQ(app_config_->retryPolicy().max_delay, 40ms);
  EXPECT_EQ(app_config_->retryPolicy().max_attempts, 3);
  EXPECT_TRUE(app_config_->optimisticEnabled());
  EXPECT_EQ(app_config_->devnet().rollup_start_block_number, 5);
  EXPECT_EQ(app_config_->devnet().rollup_end_block_number, 9);
  EXPECT_EQ(app_config_->devnet().celestia_search_height_max_look_ahead, 7);
  EXPECT_FALSE(app_config_->devnet().rollback_supported);
  EXPECT_EQ(app_config_->logTuning(),
            std::vector<std::string>{"reconciliation=trace"});
}

/**
 * @given new created AppConfigurationImpl
 * @when --config cmd line arg is provided
 * @then values are taken from the file
 */
TEST_F(AppConfigurationTest, ConfigFileTest) {
  const char *args[] = {"/path/", "--config", config_path.c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->basePath(), base_path);
  EXPECT_EQ(app_config_->commitLevel(), CommitLevel::FirmOnly);
  EXPECT_EQ(app_config_->emptyBlockPolicy(), EmptyBlockPolicy::Skip);
  EXPECT_EQ(app_config_->celestiaBlockTime(), 1500ms);
  EXPECT_EQ(app_config_->channelCapacity(), 8);
  EXPECT_EQ(app_config_->retryPolicy().max_attempts, 5);
  EXPECT_TRUE(app_config_->optimisticEnabled());
  EXPECT_EQ(app_config_->logTuning(),
            std::vector<std::string>{"reconciliation=debug"});
  EXPECT_EQ(app_config_->devnet().rollup_name, "file-rollup");
  EXPECT_EQ(app_config_->devnet().rollup_start_block_number, 10);
  EXPECT_EQ(app_config_->devnet().sequencer_start_block_height, 300);
  EXPECT_FALSE(app_config_->devnet().rollback_supported);
}

/**
 * @given new created AppConfigurationImpl
 * @when values are provided in config file and in cmd line args
 * @then we must select cmd line version
 */
TEST_F(AppConfigurationTest, CrossConfigTest) {
  const char *args[] = {"/path/",
                        "--config",
                        config_path.c_str(),
                        "--channel-capacity",
                        "16",
                        "--no-optimistic",
                        "--rollup-name",
                        "cli-rollup"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->channelCapacity(), 16);
  EXPECT_FALSE(app_config_->optimisticEnabled());
  EXPECT_EQ(app_config_->devnet().rollup_name, "cli-rollup");
  EXPECT_EQ(app_config_->celestiaBlockTime(), 1500ms);
}

/**
 * @given new created AppConfigurationImpl
 * @when the config file is damaged or missing
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, BadConfigFileTest) {
  const char *damaged[] = {"/path/", "--config", damaged_config_path.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(damaged), damaged));

  const char *missing[] = {"/path/", "--config", "<some_file>"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(missing), missing));
}

/**
 * @given new created AppConfigurationImpl
 * @when a rocksdb database is requested without a base path
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, RequiresBasePath) {
  const char *args[] = {"/path/", "--database", "rocksdb"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when no database options are provided
 * @then the commitment state is kept in memory, matching the devnet
 * execution engine which does not outlive the process either
 */
TEST_F(AppConfigurationTest, DefaultsToMemoryDatabase) {
  const char *args[] = {"/path/"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));
  EXPECT_EQ(app_config_->storageBackend(), StorageBackend::InMemory);
  EXPECT_TRUE(app_config_->basePath().empty());

  AppConfigurationImpl persistent{
      conductor::log::createLogger("AppConfigTest", "testing")};
  const char *rocksdb[] = {
      "/path/", "--database", "rocksdb", "--base-path", base_path.c_str()};
  ASSERT_TRUE(persistent.initializeFromArgs(std::size(rocksdb), rocksdb));
  EXPECT_EQ(persistent.storageBackend(), StorageBackend::RocksDb);
}

/**
 * @given new created AppConfigurationImpl
 * @when inconsistent values are provided
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, RejectsInvalidValues) {
  const std::vector<std::vector<const char *>> cases{
      {"--commit-level", "Soft"},
      {"--database", "sqlite"},
      {"--empty-block-policy", "skip"},
      {"--channel-capacity", "0"},
      {"--max-concurrent-fetches", "0"},
      {"--retry-initial-delay", "50", "--retry-max-delay", "10"},
      {"--retry-max-attempts", "0"},
      {"--optimistic", "--no-optimistic"},
      {"--rollup-start", "10", "--rollup-end", "5"},
      {"--sequencer-start", "0"},
      {"--rollup-name", ""},
      {"--channel-capacity", "many"},
  };
  for (const auto &extra : cases) {
    std::vector<const char *> args{"/path/"};
    if (std::string_view{extra.front()} != "--database") {
      args.insert(args.end(), {"--database", "memory"});
    }
    args.insert(args.end(), extra.begin(), extra.end());
    AppConfigurationImpl config{
        conductor::log::createLogger("AppConfigTest", "testing")};
    EXPECT_FALSE(config.initializeFromArgs(args.size(), args.data()))
        << fmt::format("{}", fmt::join(extra, " "));
  }
}
