/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sequencer/soft_source.hpp"

#include "primitives/height_mapping.hpp"

namespace conductor::sequencer {

  SoftSource::SoftSource(std::shared_ptr<SequencerClient> client,
                         state::SharedSourceHeights heights,
                         Config config)
      : client_{std::move(client)},
        heights_{std::move(heights)},
        config_{std::move(config)},
        log_{log::createLogger("SoftSource", "sequencer")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(heights_ != nullptr);
    BOOST_ASSERT(config_.max_concurrent_fetches > 0);
  }

  SoftSource::~SoftSource() {
    stop();
  }

  outcome::result<void> SoftSource::start(
      const primitives::ExecutionSessionParameters &session,
      std::shared_ptr<reconciliation::CandidateChannel> channel) {
    const auto first_height =
        heights_->sharedAccess([](const auto &h) { return h.next_soft; });
    auto run = std::make_shared<Run>(std::move(channel),
                                     session.rollup_id,
                                     primitives::sequencerStopHeight(session),
                                     first_height,
                                     config_.max_concurrent_fetches);
    {
      std::lock_guard lock(mutex_);
      if (run_) {
        return SoftSourceError::ALREADY_STARTED;
      }
      run_ = run;
    }
    auto abandon = [&] {
      std::lock_guard lock(mutex_);
      if (run_ == run) {
        run_.reset();
      }
    };

    auto chain_id = retryWithBackoff(config_.retry,
                                     run->cancellation,
                                     log_,
                                     "Fetching sequencer chain id",
                                     [&] { return client_->getChainId(); });
    if (chain_id.has_error()) {
      abandon();
      return chain_id.error();
    }
    if (chain_id.value() != session.sequencer_chain_id) {
      SL_ERROR(log_,
               "Sequencer chain id is '{}', session expects '{}'",
               chain_id.value(),
               session.sequencer_chain_id);
      abandon();
      return SoftSourceError::CHAIN_ID_MISMATCH;
    }

    std::lock_guard lock(mutex_);
    if (run_ != run) {
      // stopped while checking the chain id
      return RetryError::CANCELLED;
    }
    SL_INFO(log_,
            "Starting soft source at sequencer height {}{}",
            first_height,
            run->stop_height
                ? fmt::format(", stop height {}", *run->stop_height)
                : std::string{});

    // one thread for the loop, the rest for fetches
    pool_ = std::make_unique<ThreadPool>("soft",
                                         config_.max_concurrent_fetches + 1);
    run->io = pool_->io_context();
    pool_->post([this, run] { runLoop(run); });
    return outcome::success();
  }

  void SoftSource::stop() {
    std::shared_ptr<Run> run;
    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard lock(mutex_);
      run = std::move(run_);
      pool = std::move(pool_);
    }
    if (not run) {
      return;
    }
    run->cancellation.cancel();
    run->channel->close();
    run->fetched.set();
    pool.reset();
    SL_DEBUG(log_, "Soft source stopped");
  }

  void SoftSource::runLoop(std::shared_ptr<Run> run) {
    while (not run->cancellation.isCancelled()) {
      refreshLatestHeight(*run);
      scheduleFetches(run);
      if (not forwardReady(*run)) {
        SL_DEBUG(log_, "Candidate channel closed");
        break;
      }
      run->fetched.wait(config_.block_time);
    }
  }

  void SoftSource::refreshLatestHeight(Run &run) {
    auto res = client_->getLatestHeight();
    if (res.has_error()) {
      SL_WARN(log_,
              "Failed to fetch latest sequencer height: {}",
              res.error().message());
      return;
    }
    if (not run.latest_height or res.value() > *run.latest_height) {
      SL_TRACE(log_, "Latest sequencer height is {}", res.value());
      run.latest_height = res.value();
    }
  }

  void SoftSource::scheduleFetches(const std::shared_ptr<Run> &run) {
    if (not run->latest_height) {
      return;
    }
    auto expected = heights_->get();
    if (expected.soft_paused) {
      SL_TRACE(log_, "Fetching paused, soft is too far ahead of firm");
      return;
    }

    std::vector<primitives::SequencerHeight> to_fetch;
    run->fetching.exclusiveAccess([&](Fetching &f) {
      // heights below the expected one are executed already
      if (f.cache.nextHeight() < expected.next_soft) {
        f.cache.reset(expected.next_soft);
        f.next_to_fetch = std::max(f.next_to_fetch, expected.next_soft);
      }
      const auto window_end =
          f.cache.nextHeight() + config_.max_concurrent_fetches;
      while (f.in_flight.size() < config_.max_concurrent_fetches
             and f.next_to_fetch <= *run->latest_height
             and f.next_to_fetch < window_end
             and (not run->stop_height
                  or f.next_to_fetch <= *run->stop_height)) {
        const auto height = f.next_to_fetch++;
        if (f.in_flight.contains(height) or f.cache.contains(height)) {
          continue;
        }
        f.in_flight.insert(height);
        to_fetch.push_back(height);
      }
    });

    for (auto height : to_fetch) {
      boost::asio::post(*run->io, [this, run, height] { fetch(run, height); });
    }
  }

  void SoftSource::fetch(const std::shared_ptr<Run> &run,
                         primitives::SequencerHeight height) {
    auto res = retryWithBackoff(
        config_.retry,
        run->cancellation,
        log_,
        fmt::format("Fetching sequencer block {}", height),
        [&]() -> outcome::result<primitives::CandidateBlock> {
          OUTCOME_TRY(block,
                      client_->getFilteredBlock(
                          height, run->normalizer.rollupId()));
          return run->normalizer.normalize(std::move(block),
                                           primitives::Origin::Soft);
        });

    run->fetching.exclusiveAccess([&](Fetching &f) {
      f.in_flight.erase(height);
      if (res.has_error()) {
        // fetched again on the next schedule
        f.next_to_fetch = std::min(f.next_to_fetch, height);
        return;
      }
      if (auto r = f.cache.insert(std::move(res.value())); r.has_error()) {
        SL_DEBUG(log_,
                 "Dropping soft block at height {}: {}",
                 height,
                 r.error().message());
      }
    });
    run->fetched.set();
  }

  bool SoftSource::forwardReady(Run &run) {
    while (not run.cancellation.isCancelled()) {
      auto block = run.fetching.exclusiveAccess(
          [](Fetching &f) { return f.cache.pop(); });
      if (not block) {
        return true;
      }
      SL_DEBUG(log_,
               "Forwarding soft block {} at height {}",
               block->block_hash,
               block->height());
      if (not run.channel->send(std::move(block.value()))) {
        return false;
      }
    }
    return true;
  }

}  // namespace conductor::sequencer
