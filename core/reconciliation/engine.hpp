/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <mutex>

#include "execution/execution_driver.hpp"
#include "execution/optimistic_sink.hpp"
#include "log/logger.hpp"
#include "reconciliation/candidate_source.hpp"
#include "reconciliation/pending_blocks.hpp"
#include "reconciliation/status.hpp"
#include "state/commitment_state_manager.hpp"
#include "state/source_heights.hpp"
#include "utils/cancellation.hpp"

namespace conductor::reconciliation {

  /// Which sources drive the commitments
  enum class CommitLevel : uint8_t {
    SoftOnly,
    FirmOnly,
    SoftAndFirm,
  };

  /// What to do with candidates carrying no transactions for the rollup
  enum class EmptyBlockPolicy : uint8_t {
    Execute,
    /// Acknowledge without executing, only valid with FirmOnly
    Skip,
  };

  enum class EngineError : uint8_t {
    DIVERGENCE = 1,
    SOURCE_FAILED,
    OUT_OF_ORDER,
  };
  Q_ENUM_ERROR_CODE(EngineError) {
    using E = decltype(e);
    switch (e) {
      case E::DIVERGENCE:
        return "Firm block differs from the soft-executed one and the "
               "execution engine cannot roll back";
      case E::SOURCE_FAILED:
        return "Candidate source stopped before the end of the session";
      case E::OUT_OF_ORDER:
        return "Candidate skips the next expected height";
    }
    abort();
  }

  /**
   * Consumes soft and firm candidates and turns them into executed rollup
   * blocks and commitment updates. Runs on the caller's thread until it is
   * stopped or halts; every call to the execution engine and every state
   * update is made from that thread.
   */
  class ReconciliationEngine final : public StatusProvider {
   public:
    struct Config {
      CommitLevel commit_level = CommitLevel::SoftAndFirm;
      /// Soft fetching pauses at this many blocks above firm, 0 disables
      uint64_t max_soft_firm_spread = 0;
      /// Syncing ends once soft is at most this many blocks above firm
      uint64_t syncing_lag_threshold = 16;
      size_t channel_capacity = 64;
      size_t firm_failure_alert_threshold = 10;
      EmptyBlockPolicy empty_block_policy = EmptyBlockPolicy::Execute;
      std::chrono::milliseconds session_poll_interval{5000};
      /// Soft-executed blocks remembered for firm comparison
      size_t pending_capacity = 1024;
    };

    /**
     * @param soft_source may be null when commit level is FirmOnly
     * @param firm_source may be null when commit level is SoftOnly
     * @param optimistic may be null
     */
    ReconciliationEngine(Config config,
                         std::shared_ptr<execution::ExecutionDriver> driver,
                         std::shared_ptr<state::CommitmentStateManager> state,
                         std::shared_ptr<CandidateSource> soft_source,
                         std::shared_ptr<CandidateSource> firm_source,
                         state::SharedSourceHeights heights,
                         std::shared_ptr<execution::OptimisticSink> optimistic,
                         std::shared_ptr<Cancellation> cancellation);

    ~ReconciliationEngine() override;

    /**
     * Runs until stopped or halted.
     * @return the halt reason, success when stopped
     */
    outcome::result<void> run();

    /// Callable from any thread
    void stop();

    EngineStatus status() const override;

    bool isHealthy() const override;

   private:
    struct Comparison {
      bool matches;
      primitives::ExecutedBlockMetadata soft_executed;
    };

    outcome::result<void> loop();
    outcome::result<void> openSession(primitives::ExecutionSession session);
    outcome::result<void> awaitSession();

    /// Takes at most one candidate from each channel
    outcome::result<bool> step();
    outcome::result<void> onSoft(const primitives::CandidateBlock &block);
    outcome::result<void> onFirm(const primitives::CandidateBlock &block);
    /// Checks `block` against the content soft block `number` was executed
    /// from, as remembered, persisted or reported by the engine. Blocks of
    /// unknown content do not match.
    outcome::result<Comparison> compareWithSoft(
        primitives::BlockNumber number, const primitives::CandidateBlock &block);
    outcome::result<void> resolveDivergence(
        primitives::BlockNumber number, const primitives::CandidateBlock &block);

    /// Executes on `parent`, re-resolving the parent once on an ordering fault
    outcome::result<primitives::ExecutedBlockMetadata> executeOn(
        const primitives::ExecutedBlockMetadata &parent,
        const primitives::CandidateBlock &block);

    outcome::result<primitives::SequencerHeight> nextHeightAfter(
        const primitives::ExecutedBlockMetadata &executed) const;

    bool wantsSoft() const;
    bool wantsFirm() const;
    bool syncedEnough() const;
    bool pastStopHeight(primitives::SequencerHeight height) const;
    bool sessionComplete() const;
    bool sourceDone(primitives::Origin origin) const;

    std::shared_ptr<CandidateSource> &sourceOf(primitives::Origin origin);
    std::shared_ptr<CandidateChannel> &channelOf(primitives::Origin origin);
    outcome::result<void> startSource(primitives::Origin origin);
    outcome::result<void> restartSource(primitives::Origin origin);
    void stopSources();

    void publishHeights();
    void checkEscalation();
    void resetFirmFailures();
    void setState(EngineState state);
    void updateStatus();

    Config config_;
    std::shared_ptr<execution::ExecutionDriver> driver_;
    std::shared_ptr<state::CommitmentStateManager> state_;
    std::shared_ptr<CandidateSource> soft_source_;
    std::shared_ptr<CandidateSource> firm_source_;
    state::SharedSourceHeights heights_;
    std::shared_ptr<execution::OptimisticSink> optimistic_;
    std::shared_ptr<Cancellation> cancellation_;
    log::Logger log_;

    // shared by both channels
    std::shared_ptr<WaitForSingleObject> readiness_;
    // guards channel replacement against stop()
    std::mutex channels_mutex_;
    std::shared_ptr<CandidateChannel> soft_channel_;
    std::shared_ptr<CandidateChannel> firm_channel_;

    EngineState engine_state_ = EngineState::Uninitialized;
    std::optional<primitives::ExecutionSession> session_;
    primitives::SequencerHeight next_soft_height_ = 0;
    primitives::SequencerHeight next_firm_height_ = 0;
    PendingBlocks pending_;
    bool firm_degraded_ = false;

    SafeObject<EngineStatus> status_;
  };

}  // namespace conductor::reconciliation
