/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/devnet.hpp"

namespace conductor::devnet {

  Devnet::Devnet(Config config,
                 std::shared_ptr<LoopbackSequencer> sequencer,
                 std::shared_ptr<LoopbackDa> da)
      : config_{std::move(config)},
        sequencer_{std::move(sequencer)},
        da_{std::move(da)},
        log_{log::createLogger("Devnet", "devnet")},
        next_height_{config_.first_height},
        next_da_height_{config_.first_da_height} {
    BOOST_ASSERT(sequencer_ != nullptr);
    BOOST_ASSERT(da_ != nullptr);
    BOOST_ASSERT(config_.blocks_per_da_height > 0);
  }

  Devnet::~Devnet() {
    stop();
  }

  void Devnet::start() {
    std::lock_guard lock(mutex_);
    if (pool_) {
      return;
    }
    cancellation_ = std::make_shared<Cancellation>();
    pool_ = std::make_unique<ThreadPool>("devnet", 1);
    pool_->post([this] { loop(); });
    SL_INFO(log_,
            "Producing sequencer blocks from height {} every {} ms",
            next_height_,
            config_.block_time.count());
  }

  void Devnet::stop() {
    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard lock(mutex_);
      if (not pool_) {
        return;
      }
      cancellation_->cancel();
      pool = std::move(pool_);
    }
    pool.reset();
  }

  void Devnet::loop() {
    auto cancellation = cancellation_;
    size_t produced = 0;
    while (cancellation->sleepFor(config_.block_time)) {
      produceBlock();
      if (++produced % config_.blocks_per_da_height == 0) {
        auto res = relay();
        if (res.has_error()) {
          SL_ERROR(log_, "Relaying to DA failed: {}", res.error().message());
        }
      }
    }
  }

  SequencerBlock Devnet::produceBlock() {
    std::lock_guard lock(mutex_);
    const auto height = next_height_++;
    const bool empty =
        config_.empty_every != 0 and height % config_.empty_every == 0;

    RollupTransactionsMap rollups;
    if (not empty) {
      for (auto &rollup_id : config_.rollups) {
        auto &txs = rollups[rollup_id];
        for (size_t i = 0; i < config_.transactions_per_block; ++i) {
          txs.push_back(common::Buffer::fromString(
              fmt::format("{:l}/{}/{}", rollup_id, height, i)));
        }
      }
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now);
    auto block = buildBlock(
        config_.sequencer_chain_id,
        height,
        {
            .seconds = seconds.count(),
            .nanos = static_cast<uint32_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(
                    now - seconds)
                    .count()),
        },
        std::move(rollups));
    SL_DEBUG(log_,
             "Produced sequencer block {} at height {}",
             block.block_hash,
             height);
    sequencer_->push(block);
    unrelayed_.push_back(block);
    return block;
  }

  outcome::result<void> Devnet::relay() {
    std::lock_guard lock(mutex_);
    const auto da_height = next_da_height_++;
    while (not unrelayed_.empty()) {
      OUTCOME_TRY(da_->postBlock(da_height, unrelayed_.front(), config_.rollups));
      unrelayed_.pop_front();
    }
    da_->setHead(da_height);
    SL_DEBUG(log_, "Relayed sequencer blocks at DA height {}", da_height);
    return outcome::success();
  }

}  // namespace conductor::devnet
