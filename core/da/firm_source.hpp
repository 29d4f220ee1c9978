/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <set>

#include "da/da_client.hpp"
#include "da/reconstruct.hpp"
#include "log/logger.hpp"
#include "reconciliation/candidate_source.hpp"
#include "state/source_heights.hpp"
#include "utils/block_cache.hpp"
#include "utils/cancellation.hpp"
#include "utils/retry.hpp"
#include "utils/thread_pool.hpp"

namespace conductor::da {

  enum class FirmSourceError : uint8_t {
    ALREADY_STARTED = 1,
  };
  Q_ENUM_ERROR_CODE(FirmSourceError) {
    using E = decltype(e);
    switch (e) {
      case E::ALREADY_STARTED:
        return "Firm source is already running";
    }
    abort();
  }

  /**
   * Recovers firm blocks from the DA network. For the next expected
   * sequencer height it scans DA heights in the window
   * [reference, reference + look_ahead), where the reference is the DA
   * height the previous firm block was found at. An exhausted window is
   * scanned again after `poll_interval`.
   */
  class FirmSource final : public reconciliation::CandidateSource {
   public:
    struct Config {
      /// Pause between scans once the DA head or the window end is reached
      std::chrono::milliseconds poll_interval{6000};
      RetryPolicy retry;
    };

    FirmSource(std::shared_ptr<DaClient> client,
               state::SharedSourceHeights heights,
               Config config);

    ~FirmSource() override;

    primitives::Origin origin() const override {
      return primitives::Origin::Firm;
    }

    outcome::result<void> start(
        const primitives::ExecutionSessionParameters &session,
        std::shared_ptr<reconciliation::CandidateChannel> channel) override;

    void stop() override;

   private:
    struct Run {
      Run(std::shared_ptr<reconciliation::CandidateChannel> channel,
          const primitives::ExecutionSessionParameters &session);

      Cancellation cancellation;
      std::shared_ptr<reconciliation::CandidateChannel> channel;
      std::shared_ptr<const normalizer::BlockNormalizer> normalizer;
      BlockReconstructor reconstructor;
      Namespace sequencer_namespace;
      Namespace rollup_namespace;
      uint64_t look_ahead;
      std::optional<primitives::SequencerHeight> stop_height;
    };

    using Cache = BlockCache<primitives::CandidateBlock>;

    void runLoop(std::shared_ptr<Run> run);

    /**
     * Fetches, reconstructs and caches the blocks of one DA height
     * @return number of blocks and blobs at `height` that failed to verify
     */
    outcome::result<size_t> readHeight(Run &run,
                                       Cache &cache,
                                       primitives::CelestiaHeight height);

    /**
     * Sends cached blocks in order, moving the reference height along.
     * @return false if the channel is closed or the stop height is passed
     */
    bool forwardReady(Run &run,
                      Cache &cache,
                      primitives::CelestiaHeight &reference);

    /// Counts the failures of `height` unless a previous scan counted them
    void reportFailures(std::set<primitives::CelestiaHeight> &counted,
                        primitives::CelestiaHeight height,
                        size_t count);

    std::shared_ptr<DaClient> client_;
    state::SharedSourceHeights heights_;
    Config config_;
    log::Logger log_;

    std::mutex mutex_;
    std::shared_ptr<Run> run_;
    std::unique_ptr<ThreadPool> pool_;
  };

}  // namespace conductor::da
