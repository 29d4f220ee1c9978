/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/loopback_execution.hpp"

#include "crypto/sha/sha256.hpp"
#include "devnet/devnet_error.hpp"
#include "primitives/commitments.hpp"

namespace conductor::devnet {

  LoopbackExecution::LoopbackExecution(Config config)
      : config_{std::move(config)} {
    BOOST_ASSERT(not config_.sessions.empty());
    const auto start = config_.sessions.front().rollup_start_block_number;
    base_ = start == 0 ? 0 : start - 1;

    // the block preceding the first session
    Executed genesis;
    genesis.metadata.number = base_;
    genesis.metadata.hash =
        crypto::sha256(fmt::format("loopback genesis {}", base_));
    blocks_.emplace_back(std::move(genesis));
  }

  std::string LoopbackExecution::sessionId(size_t index) const {
    return fmt::format("loopback-session-{}", index);
  }

  primitives::ExecutedBlockMetadata LoopbackExecution::reported(
      const Executed &block) const {
    auto metadata = block.metadata;
    if (not config_.records_sequencer_hash) {
      metadata.sequencer_block_hash.reset();
    }
    metadata.sequencer_height.reset();
    return metadata;
  }

  outcome::result<primitives::ExecutionSession>
  LoopbackExecution::initExecutionSession() {
    std::lock_guard lock(mutex_);
    const auto head = base_ + blocks_.size() - 1;
    const auto &active = config_.sessions[active_];
    if (active.isBounded() and head >= active.rollup_end_block_number
        and active_ + 1 < config_.sessions.size()) {
      ++active_;
    }
    return primitives::ExecutionSession{
        .session_id = sessionId(active_),
        .parameters = config_.sessions[active_],
    };
  }

  outcome::result<primitives::ExecutedBlockMetadata>
  LoopbackExecution::executeBlock(
      const std::string &session_id,
      const primitives::BlockHash &parent_hash,
      const std::vector<primitives::Transaction> &transactions,
      const primitives::Timestamp &timestamp,
      const primitives::BlockHash &sequencer_block_hash) {
    std::lock_guard lock(mutex_);
    if (session_id != sessionId(active_)) {
      return DevnetError::UNKNOWN_SESSION;
    }
    const auto &parent = blocks_.back().metadata;
    if (parent.hash != parent_hash) {
      return execution::ExecutionClientError::PARENT_MISMATCH;
    }
    ++execute_calls_;

    common::Buffer preimage;
    preimage.put(parent.hash)
        .putUint64(parent.number + 1)
        .put(sequencer_block_hash)
        .put(primitives::transactionsRoot(transactions))
        .putUint64(static_cast<uint64_t>(timestamp.seconds))
        .putUint64(timestamp.nanos);

    Executed block{
        .metadata =
            {
                .number = parent.number + 1,
                .hash = crypto::sha256(preimage),
                .parent_hash = parent.hash,
                .timestamp = timestamp,
                .sequencer_block_hash = sequencer_block_hash,
                .sequencer_height = std::nullopt,
            },
        .transactions = transactions,
    };
    blocks_.push_back(block);
    return reported(block);
  }

  outcome::result<void> LoopbackExecution::updateCommitmentState(
      const std::string &session_id, const primitives::CommitmentState &state) {
    std::lock_guard lock(mutex_);
    if (session_id != sessionId(active_)) {
      return DevnetError::UNKNOWN_SESSION;
    }
    commitment_state_ = state;
    return outcome::success();
  }

  outcome::result<primitives::ExecutedBlockMetadata>
  LoopbackExecution::getExecutedBlockMetadata(primitives::BlockNumber number) {
    std::lock_guard lock(mutex_);
    if (number < base_ or number - base_ >= blocks_.size()) {
      return DevnetError::NO_SUCH_BLOCK;
    }
    return reported(blocks_[number - base_]);
  }

  outcome::result<primitives::ExecutedBlockMetadata>
  LoopbackExecution::getExecutedBlockMetadata(const primitives::BlockHash &hash) {
    std::lock_guard lock(mutex_);
    for (auto &block : blocks_) {
      if (block.metadata.hash == hash) {
        return reported(block);
      }
    }
    return DevnetError::NO_SUCH_BLOCK;
  }

  outcome::result<primitives::ExecutedBlockMetadata>
  LoopbackExecution::rollback(primitives::BlockNumber number) {
    std::lock_guard lock(mutex_);
    if (not config_.rollback_supported) {
      return DevnetError::ROLLBACK_UNSUPPORTED;
    }
    if (number < base_ or number - base_ >= blocks_.size()) {
      return DevnetError::NO_SUCH_BLOCK;
    }
    blocks_.resize(number - base_ + 1);
    return reported(blocks_.back());
  }

  void LoopbackExecution::addSession(
      primitives::ExecutionSessionParameters parameters) {
    std::lock_guard lock(mutex_);
    config_.sessions.emplace_back(std::move(parameters));
  }

  primitives::ExecutedBlockMetadata LoopbackExecution::head() const {
    std::lock_guard lock(mutex_);
    return reported(blocks_.back());
  }

  std::optional<std::vector<primitives::Transaction>>
  LoopbackExecution::transactionsOf(primitives::BlockNumber number) const {
    std::lock_guard lock(mutex_);
    if (number < base_ or number - base_ >= blocks_.size()) {
      return std::nullopt;
    }
    return blocks_[number - base_].transactions;
  }

  size_t LoopbackExecution::executeCalls() const {
    std::lock_guard lock(mutex_);
    return execute_calls_;
  }

  std::optional<primitives::CommitmentState>
  LoopbackExecution::commitmentState() const {
    std::lock_guard lock(mutex_);
    return commitment_state_;
  }

}  // namespace conductor::devnet
