/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <set>

#include "log/logger.hpp"
#include "normalizer/block_normalizer.hpp"
#include "reconciliation/candidate_source.hpp"
#include "sequencer/sequencer_client.hpp"
#include "state/source_heights.hpp"
#include "utils/block_cache.hpp"
#include "utils/cancellation.hpp"
#include "utils/retry.hpp"
#include "utils/thread_pool.hpp"

namespace conductor::sequencer {

  enum class SoftSourceError : uint8_t {
    CHAIN_ID_MISMATCH = 1,
    ALREADY_STARTED,
  };
  Q_ENUM_ERROR_CODE(SoftSourceError) {
    using E = decltype(e);
    switch (e) {
      case E::CHAIN_ID_MISMATCH:
        return "Sequencer reports a chain id other than the session's";
      case E::ALREADY_STARTED:
        return "Soft source is already running";
    }
    abort();
  }

  /**
   * Reads sequencer blocks for one rollup starting at the next expected soft
   * height. Up to `max_concurrent_fetches` heights are fetched in parallel,
   * results are reordered and forwarded strictly by height.
   */
  class SoftSource final : public reconciliation::CandidateSource {
   public:
    struct Config {
      /// Period of polling the latest sequencer height
      std::chrono::milliseconds block_time{2000};
      size_t max_concurrent_fetches = 20;
      RetryPolicy retry;
    };

    SoftSource(std::shared_ptr<SequencerClient> client,
               state::SharedSourceHeights heights,
               Config config);

    ~SoftSource() override;

    primitives::Origin origin() const override {
      return primitives::Origin::Soft;
    }

    outcome::result<void> start(
        const primitives::ExecutionSessionParameters &session,
        std::shared_ptr<reconciliation::CandidateChannel> channel) override;

    void stop() override;

   private:
    struct Fetching {
      BlockCache<primitives::CandidateBlock> cache;
      std::set<primitives::SequencerHeight> in_flight;
      primitives::SequencerHeight next_to_fetch;
    };

    /// Everything one run of the source works with
    struct Run {
      Run(std::shared_ptr<reconciliation::CandidateChannel> channel,
          const primitives::RollupId &rollup_id,
          std::optional<primitives::SequencerHeight> stop_height,
          primitives::SequencerHeight first_height,
          size_t max_cached)
          : channel{std::move(channel)},
            normalizer{rollup_id},
            stop_height{stop_height},
            fetching{Fetching{
                .cache = {first_height, max_cached},
                .in_flight = {},
                .next_to_fetch = first_height,
            }} {}

      Cancellation cancellation;
      std::shared_ptr<reconciliation::CandidateChannel> channel;
      normalizer::BlockNormalizer normalizer;
      std::optional<primitives::SequencerHeight> stop_height;
      std::optional<primitives::SequencerHeight> latest_height;
      SafeObject<Fetching> fetching;
      WaitForSingleObject fetched;
      std::shared_ptr<boost::asio::io_context> io;
    };

    void runLoop(std::shared_ptr<Run> run);
    void refreshLatestHeight(Run &run);
    void scheduleFetches(const std::shared_ptr<Run> &run);
    void fetch(const std::shared_ptr<Run> &run,
               primitives::SequencerHeight height);
    /// @return false if the channel is closed
    bool forwardReady(Run &run);

    std::shared_ptr<SequencerClient> client_;
    state::SharedSourceHeights heights_;
    Config config_;
    log::Logger log_;

    std::mutex mutex_;
    std::shared_ptr<Run> run_;
    std::unique_ptr<ThreadPool> pool_;
  };

}  // namespace conductor::sequencer
