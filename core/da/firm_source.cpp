/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/firm_source.hpp"

#include "primitives/height_mapping.hpp"

namespace conductor::da {

  FirmSource::Run::Run(
      std::shared_ptr<reconciliation::CandidateChannel> channel,
      const primitives::ExecutionSessionParameters &session)
      : channel{std::move(channel)},
        normalizer{std::make_shared<normalizer::BlockNormalizer>(
            session.rollup_id)},
        reconstructor{normalizer, session.sequencer_chain_id},
        sequencer_namespace{sequencerNamespace(session.sequencer_chain_id)},
        rollup_namespace{namespaceFromBytes(session.rollup_id)},
        look_ahead{std::max<uint64_t>(
            session.celestia_search_height_max_look_ahead, 1)},
        stop_height{primitives::sequencerStopHeight(session)} {}

  FirmSource::FirmSource(std::shared_ptr<DaClient> client,
                         state::SharedSourceHeights heights,
                         Config config)
      : client_{std::move(client)},
        heights_{std::move(heights)},
        config_{std::move(config)},
        log_{log::createLogger("FirmSource", "celestia")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(heights_ != nullptr);
  }

  FirmSource::~FirmSource() {
    stop();
  }

  outcome::result<void> FirmSource::start(
      const primitives::ExecutionSessionParameters &session,
      std::shared_ptr<reconciliation::CandidateChannel> channel) {
    std::lock_guard lock(mutex_);
    if (run_) {
      return FirmSourceError::ALREADY_STARTED;
    }
    run_ = std::make_shared<Run>(std::move(channel), session);
    SL_INFO(log_,
            "Starting firm source, sequencer namespace {:l}, rollup namespace "
            "{:l}, look-ahead {}",
            run_->sequencer_namespace,
            run_->rollup_namespace,
            run_->look_ahead);
    pool_ = std::make_unique<ThreadPool>("firm", 1);
    pool_->post([this, run{run_}] { runLoop(run); });
    return outcome::success();
  }

  void FirmSource::stop() {
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
    pool.reset();
    SL_DEBUG(log_, "Firm source stopped");
  }

  void FirmSource::runLoop(std::shared_ptr<Run> run) {
    auto start = heights_->get();
    Cache cache{start.next_firm, run->look_ahead};
    auto reference = start.celestia_search_height;
    auto next_da = reference;
    // a DA height never changes, so its failures are counted on first read
    std::set<primitives::CelestiaHeight> counted;
    SL_DEBUG(log_,
             "Searching firm block {} from DA height {}",
             cache.nextHeight(),
             reference);

    while (not run->cancellation.isCancelled()) {
      auto head = retryWithBackoff(config_.retry,
                                   run->cancellation,
                                   log_,
                                   "Fetching latest DA height",
                                   [&] { return client_->getLatestHeight(); });
      if (head.has_error()) {
        if (not run->cancellation.isCancelled()) {
          SL_ERROR(log_,
                   "Giving up on the DA network: {}",
                   head.error().message());
          run->channel->close();
        }
        return;
      }
      auto next_firm = heights_->exclusiveAccess([&](auto &h) {
        h.celestia_head = head.value();
        return h.next_firm;
      });
      if (cache.nextHeight() < next_firm) {
        cache.reset(next_firm);
      }

      while (not run->cancellation.isCancelled() and next_da <= head.value()
             and next_da < reference + run->look_ahead) {
        auto failures = readHeight(*run, cache, next_da);
        if (failures.has_error()) {
          if (not run->cancellation.isCancelled()) {
            SL_ERROR(log_,
                     "Giving up on DA height {}: {}",
                     next_da,
                     failures.error().message());
            run->channel->close();
          }
          return;
        }
        reportFailures(counted, next_da, failures.value());
        ++next_da;
        if (not forwardReady(*run, cache, reference)) {
          run->channel->close();
          return;
        }
        counted.erase(counted.begin(), counted.lower_bound(reference));
      }

      const bool caught_up = next_da > head.value();
      heights_->exclusiveAccess(
          [&](auto &h) { h.firm_caught_up = caught_up; });
      if (not caught_up) {
        SL_DEBUG(log_,
                 "No firm block {} at DA heights [{}, {}); scanning again",
                 cache.nextHeight(),
                 reference,
                 reference + run->look_ahead);
        next_da = reference;
      }
      run->cancellation.sleepFor(config_.poll_interval);
    }
  }

  outcome::result<size_t> FirmSource::readHeight(
      Run &run, Cache &cache, primitives::CelestiaHeight height) {
    auto fetch = [&](const Namespace &ns) {
      return retryWithBackoff(
          config_.retry,
          run.cancellation,
          log_,
          fmt::format("Fetching blobs at DA height {}", height),
          [&] { return client_->getBlobs(height, ns); });
    };
    OUTCOME_TRY(header_blobs, fetch(run.sequencer_namespace));
    if (header_blobs.empty()) {
      SL_TRACE(log_, "No header blobs at DA height {}", height);
      return size_t{0};
    }
    OUTCOME_TRY(rollup_blobs, fetch(run.rollup_namespace));

    auto reconstruction =
        run.reconstructor.reconstruct(height, header_blobs, rollup_blobs);
    size_t failures = reconstruction.censored + reconstruction.rejected_blobs;
    SL_DEBUG(log_,
             "DA height {}: {} header blobs, {} rollup blobs, {} blocks "
             "reconstructed",
             height,
             header_blobs.size(),
             rollup_blobs.size(),
             reconstruction.blocks.size());

    for (auto &block : reconstruction.blocks) {
      if (block.height() < cache.nextHeight()) {
        continue;
      }
      auto candidate =
          run.normalizer->normalize(std::move(block), primitives::Origin::Firm);
      if (candidate.has_error()) {
        SL_WARN(log_,
                "Dropping firm block found at DA height {}: {}",
                height,
                candidate.error().message());
        ++failures;
        continue;
      }
      candidate.value().celestia_height = height;
      if (auto res = cache.insert(std::move(candidate.value()));
          res.has_error()) {
        SL_TRACE(log_, "Firm block not cached: {}", res.error().message());
      }
    }
    return failures;
  }

  bool FirmSource::forwardReady(Run &run,
                                Cache &cache,
                                primitives::CelestiaHeight &reference) {
    while (auto block = cache.pop()) {
      if (run.stop_height and block->height() > *run.stop_height) {
        SL_INFO(log_,
                "Firm source reached the session stop height {}",
                *run.stop_height);
        return false;
      }
      SL_DEBUG(log_,
               "Forwarding firm block {} at height {} found at DA height {}",
               block->block_hash,
               block->height(),
               block->celestia_height);
      reference = std::max(reference, block->celestia_height);
      if (not run.channel->send(std::move(block.value()))) {
        return false;
      }
    }
    return true;
  }

  void FirmSource::reportFailures(
      std::set<primitives::CelestiaHeight> &counted,
      primitives::CelestiaHeight height,
      size_t count) {
    if (count == 0 or not counted.insert(height).second) {
      return;
    }
    SL_DEBUG(log_,
             "{} firm verification failures at DA height {}",
             count,
             height);
    heights_->exclusiveAccess(
        [&](auto &h) { h.consecutive_firm_failures += count; });
  }

}  // namespace conductor::da
