/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <vector>

#include "execution/execution_client.hpp"

namespace conductor::devnet {

  /**
   * Execution engine that only chains block hashes. Sessions are served in
   * order: InitExecutionSession moves to the next one once the last block
   * of the active session is executed.
   */
  class LoopbackExecution final : public execution::ExecutionClient {
   public:
    struct Config {
      /// At least one
      std::vector<primitives::ExecutionSessionParameters> sessions;
      bool rollback_supported = true;
      /// Whether metadata reports the sequencer block it was built from
      bool records_sequencer_hash = true;
    };

    explicit LoopbackExecution(Config config);

    outcome::result<primitives::ExecutionSession> initExecutionSession()
        override;

    outcome::result<primitives::ExecutedBlockMetadata> executeBlock(
        const std::string &session_id,
        const primitives::BlockHash &parent_hash,
        const std::vector<primitives::Transaction> &transactions,
        const primitives::Timestamp &timestamp,
        const primitives::BlockHash &sequencer_block_hash) override;

    outcome::result<void> updateCommitmentState(
        const std::string &session_id,
        const primitives::CommitmentState &state) override;

    outcome::result<primitives::ExecutedBlockMetadata> getExecutedBlockMetadata(
        primitives::BlockNumber number) override;

    outcome::result<primitives::ExecutedBlockMetadata> getExecutedBlockMetadata(
        const primitives::BlockHash &hash) override;

    bool supportsRollback() const override {
      return config_.rollback_supported;
    }

    outcome::result<primitives::ExecutedBlockMetadata> rollback(
        primitives::BlockNumber number) override;

    /// Adds a session served after the configured ones
    void addSession(primitives::ExecutionSessionParameters parameters);

    primitives::ExecutedBlockMetadata head() const;

    /// Transactions of executed block `number`
    std::optional<std::vector<primitives::Transaction>> transactionsOf(
        primitives::BlockNumber number) const;

    size_t executeCalls() const;

    std::optional<primitives::CommitmentState> commitmentState() const;

   private:
    struct Executed {
      primitives::ExecutedBlockMetadata metadata;
      std::vector<primitives::Transaction> transactions;
    };

    std::string sessionId(size_t index) const;
    primitives::ExecutedBlockMetadata reported(const Executed &block) const;

    Config config_;

    mutable std::mutex mutex_;
    // blocks_[i] has number base_ + i
    primitives::BlockNumber base_;
    size_t active_ = 0;
    std::vector<Executed> blocks_;
    size_t execute_calls_ = 0;
    std::optional<primitives::CommitmentState> commitment_state_;
  };

}  // namespace conductor::devnet
