/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <deque>
#include <mutex>

#include "devnet/loopback_da.hpp"
#include "devnet/loopback_sequencer.hpp"
#include "log/logger.hpp"
#include "utils/cancellation.hpp"
#include "utils/thread_pool.hpp"

namespace conductor::devnet {

  /**
   * Produces sequencer blocks into a LoopbackSequencer and relays them to a
   * LoopbackDa, so the conductor runs end to end in one process.
   * Every `empty_every`-th block carries no transactions for the rollups.
   */
  class Devnet {
   public:
    struct Config {
      std::string sequencer_chain_id;
      std::vector<primitives::RollupId> rollups;
      primitives::SequencerHeight first_height = 1;
      primitives::CelestiaHeight first_da_height = 1;
      std::chrono::milliseconds block_time{1000};
      /// Sequencer blocks relayed to the DA network in one DA block
      size_t blocks_per_da_height = 3;
      size_t transactions_per_block = 2;
      /// 0 disables empty blocks
      size_t empty_every = 5;
    };

    Devnet(Config config,
           std::shared_ptr<LoopbackSequencer> sequencer,
           std::shared_ptr<LoopbackDa> da);

    ~Devnet();

    void start();

    void stop();

    /// Produces the next sequencer block
    SequencerBlock produceBlock();

    /// Posts all produced but unrelayed blocks at the next DA height
    outcome::result<void> relay();

   private:
    void loop();

    Config config_;
    std::shared_ptr<LoopbackSequencer> sequencer_;
    std::shared_ptr<LoopbackDa> da_;
    log::Logger log_;

    std::mutex mutex_;
    primitives::SequencerHeight next_height_;
    primitives::CelestiaHeight next_da_height_;
    std::deque<SequencerBlock> unrelayed_;

    std::shared_ptr<Cancellation> cancellation_;
    std::unique_ptr<ThreadPool> pool_;
  };

}  // namespace conductor::devnet
