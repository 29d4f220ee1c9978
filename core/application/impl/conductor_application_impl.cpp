/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/conductor_application_impl.hpp"

#include <unistd.h>

#include <boost/assert.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_state_manager_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "da/firm_source.hpp"
#include "devnet/devnet.hpp"
#include "devnet/loopback_da.hpp"
#include "devnet/loopback_execution.hpp"
#include "devnet/loopback_sequencer.hpp"
#include "execution/execution_driver.hpp"
#include "execution/optimistic_buffer.hpp"
#include "reconciliation/engine.hpp"
#include "sequencer/soft_source.hpp"
#include "state/commitment_state_manager.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "utils/mkdirs.hpp"

namespace conductor::application {

  ConductorApplicationImpl::ConductorApplicationImpl(
      sptr<AppConfiguration> app_config)
      : app_config_(std::move(app_config)),
        logger_(log::createLogger("Application", "application")) {
    BOOST_ASSERT(app_config_ != nullptr);
  }

  ConductorApplicationImpl::~ConductorApplicationImpl() {
    stop();
  }

  outcome::result<std::shared_ptr<storage::SpacedStorage>>
  ConductorApplicationImpl::makeStorage() const {
    if (app_config_->storageBackend() == StorageBackend::InMemory) {
      SL_INFO(logger_,
              "Commitment state is kept in memory and lost on restart");
      return std::make_shared<storage::InMemorySpacedStorage>();
    }
    SL_WARN(logger_,
            "The devnet execution engine starts from its genesis on every "
            "run; a commitment state persisted by an earlier run points past "
            "it and the conductor halts on restart unless the database is "
            "removed");
    const auto &path = app_config_->basePath();
    OUTCOME_TRY(mkdirs(path));
    rocksdb::Options options;
    options.create_if_missing = true;
    OUTCOME_TRY(db, storage::RocksDb::create(path / "db", options));
    SL_INFO(logger_, "Database is {}", (path / "db").native());
    return db;
  }

  bool ConductorApplicationImpl::inject() {
    auto storage_res = makeStorage();
    if (storage_res.has_error()) {
      SL_CRITICAL(logger_,
                  "Error opening the database at {}: {}",
                  app_config_->basePath().native(),
                  storage_res.error().message());
      return false;
    }

    const auto &net = app_config_->devnet();
    const primitives::RollupId rollup_id{crypto::sha256(net.rollup_name)};
    SL_INFO(logger_, "Rollup '{}' has id {}", net.rollup_name, rollup_id);

    primitives::ExecutionSessionParameters session{
        .rollup_id = rollup_id,
        .rollup_start_block_number = net.rollup_start_block_number,
        .rollup_end_block_number = net.rollup_end_block_number,
        .sequencer_chain_id = net.sequencer_chain_id,
        .sequencer_start_block_height = net.sequencer_start_block_height,
        .celestia_chain_id = net.celestia_chain_id,
        .celestia_search_height_max_look_ahead =
            net.celestia_search_height_max_look_ahead,
        .celestia_start_height = net.celestia_start_height,
    };

    cancellation_ = std::make_shared<Cancellation>();

    auto sequencer =
        std::make_shared<devnet::LoopbackSequencer>(net.sequencer_chain_id);
    auto da = std::make_shared<devnet::LoopbackDa>();
    devnet_ = std::make_shared<devnet::Devnet>(
        devnet::Devnet::Config{
            .sequencer_chain_id = net.sequencer_chain_id,
            .rollups = {rollup_id},
            .first_height = net.sequencer_start_block_height,
            .first_da_height = net.celestia_start_height,
            .block_time = net.block_time,
        },
        sequencer,
        da);

    auto execution = std::make_shared<devnet::LoopbackExecution>(
        devnet::LoopbackExecution::Config{
            .sessions = {session},
            .rollback_supported = net.rollback_supported,
        });
    auto driver = std::make_shared<execution::ExecutionDriver>(
        execution, app_config_->retryPolicy(), cancellation_);
    auto state = std::make_shared<state::CommitmentStateManager>(
        std::move(storage_res.value()), driver);

    auto heights = std::make_shared<SafeObject<state::SourceHeights>>();
    const auto commit_level = app_config_->commitLevel();

    std::shared_ptr<reconciliation::CandidateSource> soft_source;
    if (commit_level != reconciliation::CommitLevel::FirmOnly) {
      soft_source = std::make_shared<sequencer::SoftSource>(
          sequencer,
          heights,
          sequencer::SoftSource::Config{
              .block_time = app_config_->sequencerBlockTime(),
              .max_concurrent_fetches = app_config_->maxConcurrentFetches(),
              .retry = app_config_->retryPolicy(),
          });
    }

    std::shared_ptr<reconciliation::CandidateSource> firm_source;
    if (commit_level != reconciliation::CommitLevel::SoftOnly) {
      firm_source = std::make_shared<da::FirmSource>(
          da,
          heights,
          da::FirmSource::Config{
              .poll_interval = app_config_->celestiaBlockTime(),
              .retry = app_config_->retryPolicy(),
          });
    }

    std::shared_ptr<execution::OptimisticSink> optimistic;
    if (app_config_->optimisticEnabled()) {
      optimistic = std::make_shared<execution::OptimisticBuffer>(
          rollup_id, app_config_->channelCapacity());
    }

    engine_ = std::make_shared<reconciliation::ReconciliationEngine>(
        reconciliation::ReconciliationEngine::Config{
            .commit_level = commit_level,
            .max_soft_firm_spread = app_config_->maxSoftFirmSpread(),
            .syncing_lag_threshold = app_config_->syncingLagThreshold(),
            .channel_capacity = app_config_->channelCapacity(),
            .firm_failure_alert_threshold =
                app_config_->firmFailureAlertThreshold(),
            .empty_block_policy = app_config_->emptyBlockPolicy(),
            .session_poll_interval = app_config_->sessionPollInterval(),
        },
        driver,
        state,
        std::move(soft_source),
        std::move(firm_source),
        heights,
        std::move(optimistic),
        cancellation_);
    return true;
  }

  bool ConductorApplicationImpl::start() {
    devnet_->start();
    engine_thread_ = std::thread([this] { engineLoop(); });
    if (app_config_->statusLogInterval().count() > 0) {
      status_thread_ = std::thread([this] { statusLoop(); });
    }
    return true;
  }

  void ConductorApplicationImpl::stop() {
    if (not engine_) {
      return;
    }
    engine_->stop();
    cancellation_->cancel();
    for (auto *thread : {&engine_thread_, &status_thread_}) {
      if (thread->joinable()) {
        thread->join();
      }
    }
    devnet_->stop();
    if (not stopped_.exchange(true)) {
      logStatus();
    }
  }

  void ConductorApplicationImpl::engineLoop() {
    soralog::util::setThreadName("engine");
    auto res = engine_->run();
    if (res.has_error()) {
      SL_CRITICAL(logger_,
                  "Reconciliation halted: {}",
                  res.error().message());
      exit_code_ = EXIT_FAILURE;
    }
    app_state_manager_->shutdown();
  }

  void ConductorApplicationImpl::statusLoop() {
    soralog::util::setThreadName("status");
    while (cancellation_->sleepFor(app_config_->statusLogInterval())) {
      logStatus();
    }
  }

  void ConductorApplicationImpl::logStatus() const {
    auto status = engine_->status();
    SL_INFO(logger_,
            "State {}, soft {}, firm {}, celestia height {}{}",
            status.state,
            status.soft,
            status.firm,
            status.celestia_height,
            status.firm_source_degraded ? ", firm source degraded" : "");
    if (status.halt_reason) {
      SL_ERROR(logger_, "Halt reason: {}", *status.halt_reason);
    }
  }

  int ConductorApplicationImpl::run() {
    SL_INFO(logger_, "Start conductor with PID {}", getpid());

    app_state_manager_ = std::make_shared<AppStateManagerImpl>();
    app_state_manager_->takeControl(*this);

    app_state_manager_->run();

    if (app_state_manager_->state() != AppStateManager::State::ReadyToStop
        or not engine_) {
      return EXIT_FAILURE;
    }
    return exit_code_;
  }

}  // namespace conductor::application
