/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reconciliation/engine.hpp"

#include "primitives/height_mapping.hpp"

namespace conductor::reconciliation {

  namespace {
    // wake up without candidates to check cancellation and escalation
    constexpr std::chrono::milliseconds kIdleWait{1000};
  }  // namespace

  ReconciliationEngine::ReconciliationEngine(
      Config config,
      std::shared_ptr<execution::ExecutionDriver> driver,
      std::shared_ptr<state::CommitmentStateManager> state,
      std::shared_ptr<CandidateSource> soft_source,
      std::shared_ptr<CandidateSource> firm_source,
      state::SharedSourceHeights heights,
      std::shared_ptr<execution::OptimisticSink> optimistic,
      std::shared_ptr<Cancellation> cancellation)
      : config_{std::move(config)},
        driver_{std::move(driver)},
        state_{std::move(state)},
        soft_source_{std::move(soft_source)},
        firm_source_{std::move(firm_source)},
        heights_{std::move(heights)},
        optimistic_{std::move(optimistic)},
        cancellation_{std::move(cancellation)},
        log_{log::createLogger("ReconciliationEngine", "reconciliation")},
        readiness_{std::make_shared<WaitForSingleObject>()},
        pending_{config_.pending_capacity} {
    BOOST_ASSERT(driver_ != nullptr);
    BOOST_ASSERT(state_ != nullptr);
    BOOST_ASSERT(heights_ != nullptr);
    BOOST_ASSERT(cancellation_ != nullptr);
    BOOST_ASSERT(not wantsSoft() or soft_source_ != nullptr);
    BOOST_ASSERT(not wantsFirm() or firm_source_ != nullptr);
    BOOST_ASSERT(config_.channel_capacity > 0);
  }

  ReconciliationEngine::~ReconciliationEngine() {
    stopSources();
  }

  outcome::result<void> ReconciliationEngine::run() {
    auto res = loop();
    stopSources();
    if (res.has_error()) {
      if (cancellation_->isCancelled()
          and res.error() == RetryError::CANCELLED) {
        SL_INFO(log_, "Stopped while waiting for a remote call");
        return outcome::success();
      }
      status_.exclusiveAccess([&](EngineStatus &status) {
        status.halt_reason = res.error().message();
      });
      setState(EngineState::Halted);
      SL_ERROR(log_, "Halted: {}", res.error().message());
      return res.error();
    }
    SL_INFO(log_, "Stopped");
    return outcome::success();
  }

  void ReconciliationEngine::stop() {
    cancellation_->cancel();
    {
      std::lock_guard lock(channels_mutex_);
      for (auto &channel : {soft_channel_, firm_channel_}) {
        if (channel) {
          channel->close();
        }
      }
    }
    readiness_->set();
    stopSources();
  }

  EngineStatus ReconciliationEngine::status() const {
    return status_.get();
  }

  bool ReconciliationEngine::isHealthy() const {
    return status_.sharedAccess([](const EngineStatus &status) {
      return status.state != EngineState::Halted;
    });
  }

  outcome::result<void> ReconciliationEngine::loop() {
    OUTCOME_TRY(session, driver_->initSession());
    OUTCOME_TRY(openSession(std::move(session)));

    while (not cancellation_->isCancelled()) {
      checkEscalation();

      if (engine_state_ == EngineState::AwaitingSession) {
        OUTCOME_TRY(awaitSession());
        continue;
      }

      OUTCOME_TRY(progressed, step());

      if (sessionComplete()) {
        SL_INFO(log_,
                "Session '{}' reached its last block {}, requesting the next "
                "one",
                session_->session_id,
                session_->parameters.rollup_end_block_number);
        stopSources();
        setState(EngineState::AwaitingSession);
        continue;
      }
      if (engine_state_ == EngineState::Syncing and syncedEnough()) {
        SL_INFO(log_,
                "Firm caught up with soft at {}, following",
                state_->state().firm);
        setState(EngineState::Following);
      }
      if (not progressed) {
        readiness_->wait(kIdleWait);
      }
    }
    return outcome::success();
  }

  outcome::result<void> ReconciliationEngine::openSession(
      primitives::ExecutionSession session) {
    pending_.clear();
    session_ = std::move(session);
    OUTCOME_TRY(loaded, state_->load(session_->parameters));
    driver_->setHead(loaded.soft);

    OUTCOME_TRY(next_soft, nextHeightAfter(loaded.soft));
    OUTCOME_TRY(next_firm, nextHeightAfter(loaded.firm));
    next_soft_height_ = next_soft;
    next_firm_height_ = next_firm;
    publishHeights();
    SL_INFO(log_,
            "Resuming with soft {} and firm {}, next sequencer heights {} and "
            "{}",
            loaded.soft,
            loaded.firm,
            next_soft_height_,
            next_firm_height_);

    setState(wantsFirm() ? EngineState::Syncing : EngineState::Following);

    if (wantsSoft()) {
      OUTCOME_TRY(startSource(primitives::Origin::Soft));
    }
    if (wantsFirm()) {
      OUTCOME_TRY(startSource(primitives::Origin::Firm));
    }
    return outcome::success();
  }

  outcome::result<void> ReconciliationEngine::awaitSession() {
    OUTCOME_TRY(session, driver_->initSession());
    if (session.session_id == session_->session_id) {
      SL_DEBUG(log_, "No new execution session yet");
      cancellation_->sleepFor(config_.session_poll_interval);
      return outcome::success();
    }
    return openSession(std::move(session));
  }

  outcome::result<bool> ReconciliationEngine::step() {
    bool progressed = false;
    for (auto origin : {primitives::Origin::Firm, primitives::Origin::Soft}) {
      if (origin == primitives::Origin::Soft
          and (not wantsSoft() or engine_state_ != EngineState::Following)) {
        continue;
      }
      if (origin == primitives::Origin::Firm and not wantsFirm()) {
        continue;
      }
      auto &channel = channelOf(origin);
      if (not channel) {
        continue;
      }
      auto candidate = channel->tryReceive();
      if (not candidate) {
        if (channel->isDrained() and not cancellation_->isCancelled()
            and not sourceDone(origin)) {
          SL_ERROR(log_, "The {} source closed its channel", origin);
          return EngineError::SOURCE_FAILED;
        }
        continue;
      }
      progressed = true;
      if (origin == primitives::Origin::Soft) {
        OUTCOME_TRY(onSoft(*candidate));
      } else {
        OUTCOME_TRY(onFirm(*candidate));
      }
      updateStatus();
    }
    return progressed;
  }

  outcome::result<void> ReconciliationEngine::onSoft(
      const primitives::CandidateBlock &block) {
    const auto height = block.height();
    if (height < next_soft_height_ or pastStopHeight(height)) {
      SL_TRACE(log_,
               "Dropping stale soft block {} at height {}",
               block.block_hash,
               height);
      return outcome::success();
    }
    if (height > next_soft_height_) {
      SL_ERROR(log_,
               "Soft block at height {} while expecting height {}",
               height,
               next_soft_height_);
      return EngineError::OUT_OF_ORDER;
    }

    if (optimistic_) {
      auto res = optimistic_->onSoftCandidate(block);
      if (res.has_error()) {
        SL_WARN(log_,
                "Optimistic sink rejected soft block {}: {}",
                block.block_hash,
                res.error().message());
      }
    }

    OUTCOME_TRY(executed, executeOn(state_->state().soft, block));
    const auto digest = ContentDigest::of(block);
    OUTCOME_TRY(state_->recordSoftContent(executed.number, digest));
    OUTCOME_TRY(state_->advance(primitives::Origin::Soft, executed));
    pending_.put({
        .executed = executed,
        .digest = digest,
    });
    next_soft_height_ = height + 1;
    SL_DEBUG(log_,
             "Executed soft block {} at height {} as {}",
             block.block_hash,
             height,
             executed);
    publishHeights();
    return outcome::success();
  }

  outcome::result<void> ReconciliationEngine::onFirm(
      const primitives::CandidateBlock &block) {
    const auto height = block.height();
    if (height < next_firm_height_ or pastStopHeight(height)) {
      SL_TRACE(log_,
               "Dropping stale firm block {} at height {}",
               block.block_hash,
               height);
      return outcome::success();
    }
    if (height > next_firm_height_) {
      SL_ERROR(log_,
               "Firm block at height {} while expecting height {}",
               height,
               next_firm_height_);
      return EngineError::OUT_OF_ORDER;
    }
    resetFirmFailures();

    if (config_.empty_block_policy == EmptyBlockPolicy::Skip
        and block.transactions.empty()) {
      SL_DEBUG(log_, "Skipping empty firm block at height {}", height);
      next_firm_height_ = height + 1;
      next_soft_height_ = std::max(next_soft_height_, next_firm_height_);
      OUTCOME_TRY(state_->setCelestiaSearchHeight(block.celestia_height));
      publishHeights();
      return outcome::success();
    }

    const auto current = state_->state();
    if (current.firm.number == current.soft.number) {
      OUTCOME_TRY(executed, executeOn(current.soft, block));
      OUTCOME_TRY(state_->advanceBoth(executed, block.celestia_height));
      pending_.eraseUpTo(executed.number);
      next_firm_height_ = height + 1;
      next_soft_height_ = std::max(next_soft_height_, next_firm_height_);
      SL_DEBUG(log_,
               "Executed firm block {} at height {} as {}",
               block.block_hash,
               height,
               executed);
      publishHeights();
      return outcome::success();
    }

    const auto number = current.firm.number + 1;
    OUTCOME_TRY(comparison, compareWithSoft(number, block));
    if (not comparison.matches) {
      return resolveDivergence(number, block);
    }
    OUTCOME_TRY(state_->advance(primitives::Origin::Firm,
                                comparison.soft_executed,
                                block.celestia_height));
    pending_.eraseUpTo(number);
    next_firm_height_ = height + 1;
    SL_DEBUG(log_,
             "Firm block {} at height {} confirms {}",
             block.block_hash,
             height,
             comparison.soft_executed);
    publishHeights();
    return outcome::success();
  }

  outcome::result<ReconciliationEngine::Comparison>
  ReconciliationEngine::compareWithSoft(
      primitives::BlockNumber number, const primitives::CandidateBlock &block) {
    if (auto pending = pending_.get(number)) {
      return Comparison{
          .matches = pending->digest == ContentDigest::of(block),
          .soft_executed = pending->executed,
      };
    }
    OUTCOME_TRY(executed, driver_->resolve(number));
    OUTCOME_TRY(recorded, state_->softContent(number));
    if (recorded) {
      return Comparison{
          .matches = *recorded == ContentDigest::of(block),
          .soft_executed = executed,
      };
    }
    if (not executed.sequencer_block_hash) {
      SL_WARN(log_,
              "Neither the conductor nor the execution engine knows what "
              "block {} was built from, treating firm block {} as divergent",
              executed,
              block.block_hash);
      return Comparison{.matches = false, .soft_executed = executed};
    }
    return Comparison{
        .matches = *executed.sequencer_block_hash == block.block_hash,
        .soft_executed = executed,
    };
  }

  outcome::result<void> ReconciliationEngine::resolveDivergence(
      primitives::BlockNumber number, const primitives::CandidateBlock &block) {
    SL_WARN(log_,
            "Firm block {} at height {} differs from soft-executed block {}",
            block.block_hash,
            block.height(),
            number);
    if (not driver_->supportsRollback()) {
      SL_ERROR(log_,
               "Execution engine cannot roll back, soft block {} stays "
               "divergent",
               number);
      return EngineError::DIVERGENCE;
    }

    OUTCOME_TRY(head, driver_->rollback(number - 1));
    OUTCOME_TRY(state_->rollback(head));
    pending_.eraseAbove(head.number);

    OUTCOME_TRY(executed, executeOn(head, block));
    OUTCOME_TRY(state_->advanceBoth(executed, block.celestia_height));
    pending_.eraseUpTo(executed.number);
    next_firm_height_ = block.height() + 1;
    next_soft_height_ = next_firm_height_;
    SL_INFO(log_,
            "Rolled back to {} and re-executed firm block {} as {}",
            head,
            block.block_hash,
            executed);
    publishHeights();

    // soft candidates already delivered belong to the abandoned branch
    return restartSource(primitives::Origin::Soft);
  }

  outcome::result<primitives::ExecutedBlockMetadata>
  ReconciliationEngine::executeOn(const primitives::ExecutedBlockMetadata &parent,
                                  const primitives::CandidateBlock &block) {
    auto res = driver_->execute(parent, block);
    if (res.has_error()
        and res.error() == execution::ExecutionError::ORDERING_FAULT) {
      SL_WARN(log_, "Re-resolving parent {} after an ordering fault", parent);
      OUTCOME_TRY(actual, driver_->resolve(parent.number));
      driver_->setHead(actual);
      return driver_->execute(actual, block);
    }
    return res;
  }

  outcome::result<primitives::SequencerHeight>
  ReconciliationEngine::nextHeightAfter(
      const primitives::ExecutedBlockMetadata &executed) const {
    // skipped blocks keep numbers and heights apart
    if (config_.empty_block_policy == EmptyBlockPolicy::Skip
        and executed.sequencer_height) {
      return *executed.sequencer_height + 1;
    }
    return primitives::nextSequencerHeight(session_->parameters,
                                           executed.number);
  }

  bool ReconciliationEngine::wantsSoft() const {
    return config_.commit_level != CommitLevel::FirmOnly;
  }

  bool ReconciliationEngine::wantsFirm() const {
    return config_.commit_level != CommitLevel::SoftOnly;
  }

  bool ReconciliationEngine::syncedEnough() const {
    if (not wantsSoft()) {
      return heights_->sharedAccess(
          [](const state::SourceHeights &h) { return h.firm_caught_up; });
    }
    const auto &current = state_->state();
    if (current.soft.number - current.firm.number
        <= config_.syncing_lag_threshold) {
      return true;
    }
    return heights_->sharedAccess(
        [](const state::SourceHeights &h) { return h.firm_caught_up; });
  }

  bool ReconciliationEngine::pastStopHeight(
      primitives::SequencerHeight height) const {
    auto stop = primitives::sequencerStopHeight(session_->parameters);
    return stop and height > *stop;
  }

  bool ReconciliationEngine::sourceDone(primitives::Origin origin) const {
    return pastStopHeight(origin == primitives::Origin::Soft
                              ? next_soft_height_
                              : next_firm_height_);
  }

  bool ReconciliationEngine::sessionComplete() const {
    if (not session_->parameters.isBounded()) {
      return false;
    }
    return (not wantsSoft() or sourceDone(primitives::Origin::Soft))
       and (not wantsFirm() or sourceDone(primitives::Origin::Firm));
  }

  std::shared_ptr<CandidateSource> &ReconciliationEngine::sourceOf(
      primitives::Origin origin) {
    return origin == primitives::Origin::Soft ? soft_source_ : firm_source_;
  }

  std::shared_ptr<CandidateChannel> &ReconciliationEngine::channelOf(
      primitives::Origin origin) {
    return origin == primitives::Origin::Soft ? soft_channel_ : firm_channel_;
  }

  outcome::result<void> ReconciliationEngine::startSource(
      primitives::Origin origin) {
    if (cancellation_->isCancelled()) {
      return outcome::success();
    }
    auto channel =
        std::make_shared<CandidateChannel>(config_.channel_capacity, readiness_);
    {
      std::lock_guard lock(channels_mutex_);
      channelOf(origin) = channel;
    }
    SL_DEBUG(log_, "Starting the {} source", origin);
    return sourceOf(origin)->start(session_->parameters, std::move(channel));
  }

  outcome::result<void> ReconciliationEngine::restartSource(
      primitives::Origin origin) {
    if (not sourceOf(origin)
        or (origin == primitives::Origin::Soft ? not wantsSoft()
                                               : not wantsFirm())) {
      return outcome::success();
    }
    sourceOf(origin)->stop();
    return startSource(origin);
  }

  void ReconciliationEngine::stopSources() {
    for (auto &source : {soft_source_, firm_source_}) {
      if (source) {
        source->stop();
      }
    }
  }

  void ReconciliationEngine::publishHeights() {
    const auto &current = state_->state();
    const bool paused = config_.commit_level == CommitLevel::SoftAndFirm
                    and config_.max_soft_firm_spread > 0
                    and current.soft.number - current.firm.number
                            >= config_.max_soft_firm_spread;
    heights_->exclusiveAccess([&](state::SourceHeights &h) {
      if (paused and not h.soft_paused) {
        SL_INFO(log_,
                "Soft is {} blocks above firm, pausing soft fetching",
                current.soft.number - current.firm.number);
      }
      h.next_soft = next_soft_height_;
      h.next_firm = next_firm_height_;
      h.soft_paused = paused;
      h.celestia_search_height = current.lowest_celestia_search_height;
    });
    updateStatus();
  }

  void ReconciliationEngine::checkEscalation() {
    const auto failures =
        heights_->sharedAccess([](const state::SourceHeights &h) {
          return h.consecutive_firm_failures;
        });
    if (failures >= config_.firm_failure_alert_threshold
        and not firm_degraded_) {
      firm_degraded_ = true;
      SL_CRITICAL(log_,
                  "{} consecutive firm blocks failed verification, the DA "
                  "data for the rollup may be withheld or forged",
                  failures);
    }
    status_.exclusiveAccess([&](EngineStatus &status) {
      status.consecutive_firm_failures = failures;
      status.firm_source_degraded = firm_degraded_;
    });
  }

  void ReconciliationEngine::resetFirmFailures() {
    heights_->exclusiveAccess(
        [](state::SourceHeights &h) { h.consecutive_firm_failures = 0; });
    if (firm_degraded_) {
      SL_INFO(log_, "Firm source recovered");
      firm_degraded_ = false;
    }
  }

  void ReconciliationEngine::setState(EngineState state) {
    if (engine_state_ != state) {
      SL_DEBUG(log_, "State {} -> {}", engine_state_, state);
    }
    engine_state_ = state;
    updateStatus();
  }

  void ReconciliationEngine::updateStatus() {
    status_.exclusiveAccess([&](EngineStatus &status) {
      status.state = engine_state_;
      status.firm_source_degraded = firm_degraded_;
      if (state_->isLoaded()) {
        const auto &current = state_->state();
        status.soft = current.soft;
        status.firm = current.firm;
        status.celestia_height = current.lowest_celestia_search_height;
      }
    });
  }

}  // namespace conductor::reconciliation
