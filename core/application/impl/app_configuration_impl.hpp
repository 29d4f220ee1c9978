/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson {
  using SizeType = ::std::size_t;
}
#include <rapidjson/document.h>
#undef RAPIDJSON_NO_SIZETYPEDEFINE

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace conductor::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on
  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * Parses the command line and the config file it names.
     * @return false if the node must not start, errors are logged
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    std::chrono::milliseconds sequencerBlockTime() const override {
      return sequencer_block_time_;
    }
    std::chrono::milliseconds celestiaBlockTime() const override {
      return celestia_block_time_;
    }
    std::chrono::milliseconds sessionPollInterval() const override {
      return session_poll_interval_;
    }
    std::chrono::milliseconds statusLogInterval() const override {
      return status_log_interval_;
    }

    DECLARE_PROPERTY(std::filesystem::path, basePath);
    DECLARE_PROPERTY(StorageBackend, storageBackend);
    DECLARE_PROPERTY(reconciliation::CommitLevel, commitLevel);
    DECLARE_PROPERTY(uint64_t, maxSoftFirmSpread);
    DECLARE_PROPERTY(size_t, maxConcurrentFetches);
    DECLARE_PROPERTY(size_t, channelCapacity);
    DECLARE_PROPERTY(RetryPolicy, retryPolicy);
    DECLARE_PROPERTY(size_t, firmFailureAlertThreshold);
    DECLARE_PROPERTY(uint64_t, syncingLagThreshold);
    DECLARE_PROPERTY(reconciliation::EmptyBlockPolicy, emptyBlockPolicy);
    DECLARE_PROPERTY(bool, optimisticEnabled);
    DECLARE_PROPERTY(std::vector<std::string>, logTuning);
    DECLARE_PROPERTY(DevnetConfig, devnet);

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_storage_segment(const rapidjson::Value &val);
    void parse_conductor_segment(const rapidjson::Value &val);
    void parse_devnet_segment(const rapidjson::Value &val);

    /// Segment names and their parsers
    struct SegmentHandler {
      using Handler = std::function<void(rapidjson::Value &)>;
      char const *segment_name;
      Handler handler;
    };

    std::vector<SegmentHandler> handlers_;

    /// @return false if the file cannot be read or parsed
    bool read_config_from_file(const std::string &filepath);

    bool validate_config();

    bool parse_commit_level(std::string_view str);
    bool parse_empty_block_policy(std::string_view str);
    bool parse_storage_backend(std::string_view str);

    static FilePtr open_file(const std::string &filepath);

    static bool load_str(const rapidjson::Value &val,
                         const char *name,
                         std::string &target);
    static bool load_bool(const rapidjson::Value &val,
                          const char *name,
                          bool &target);
    static bool load_u64(const rapidjson::Value &val,
                         const char *name,
                         uint64_t &target);
    static bool load_ms(const rapidjson::Value &val,
                        const char *name,
                        std::chrono::milliseconds &target);
    static bool load_vs(const rapidjson::Value &val,
                        const char *name,
                        std::vector<std::string> &target);

    log::Logger logger_;
    std::chrono::milliseconds sequencer_block_time_;
    std::chrono::milliseconds celestia_block_time_;
    std::chrono::milliseconds session_poll_interval_;
    std::chrono::milliseconds status_log_interval_;
    std::string commit_level_str_;
    std::string empty_block_policy_str_;
    std::string storage_backend_str_;
  };

}  // namespace conductor::application

#undef DECLARE_PROPERTY
