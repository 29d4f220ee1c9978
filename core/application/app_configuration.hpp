/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reconciliation/engine.hpp"
#include "utils/retry.hpp"

namespace conductor::application {

  enum class StorageBackend : uint8_t {
    RocksDb,
    InMemory,
  };

  /// Parameters of the in-process networks the node runs against
  struct DevnetConfig {
    std::string rollup_name;
    std::string sequencer_chain_id;
    std::string celestia_chain_id;
    primitives::BlockNumber rollup_start_block_number = 1;
    /// 0 means unbounded
    primitives::BlockNumber rollup_end_block_number = 0;
    primitives::SequencerHeight sequencer_start_block_height = 1;
    primitives::CelestiaHeight celestia_start_height = 1;
    uint64_t celestia_search_height_max_look_ahead = 50;
    std::chrono::milliseconds block_time{1000};
    bool rollback_supported = true;
  };

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /// Directory of the database
    virtual const std::filesystem::path &basePath() const = 0;

    virtual StorageBackend storageBackend() const = 0;

    virtual reconciliation::CommitLevel commitLevel() const = 0;

    virtual std::chrono::milliseconds sequencerBlockTime() const = 0;

    virtual std::chrono::milliseconds celestiaBlockTime() const = 0;

    /// 0 disables the pause
    virtual uint64_t maxSoftFirmSpread() const = 0;

    virtual size_t maxConcurrentFetches() const = 0;

    virtual size_t channelCapacity() const = 0;

    virtual const RetryPolicy &retryPolicy() const = 0;

    virtual size_t firmFailureAlertThreshold() const = 0;

    virtual uint64_t syncingLagThreshold() const = 0;

    virtual reconciliation::EmptyBlockPolicy emptyBlockPolicy() const = 0;

    /// Whether soft candidates are exposed to the optimistic sink
    virtual bool optimisticEnabled() const = 0;

    virtual std::chrono::milliseconds sessionPollInterval() const = 0;

    virtual std::chrono::milliseconds statusLogInterval() const = 0;

    /// `group=level` or `level` overrides of the logging system
    virtual const std::vector<std::string> &logTuning() const = 0;

    virtual const DevnetConfig &devnet() const = 0;
  };

}  // namespace conductor::application
