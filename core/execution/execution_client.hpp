/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/execution.hpp"

namespace conductor::execution {

  enum class ExecutionClientError : uint8_t {
    PARENT_MISMATCH = 1,
  };
  Q_ENUM_ERROR_CODE(ExecutionClientError) {
    using E = decltype(e);
    switch (e) {
      case E::PARENT_MISMATCH:
        return "Parent is not the head of the executed chain";
    }
    abort();
  }

  /**
   * Execution engine of the rollup. Every call after InitExecutionSession
   * carries the session id it returned.
   */
  class ExecutionClient {
   public:
    virtual ~ExecutionClient() = default;

    virtual outcome::result<primitives::ExecutionSession>
    initExecutionSession() = 0;

    /// Builds a block on top of `parent_hash`
    /// @return PARENT_MISMATCH if `parent_hash` is not the engine's head
    virtual outcome::result<primitives::ExecutedBlockMetadata> executeBlock(
        const std::string &session_id,
        const primitives::BlockHash &parent_hash,
        const std::vector<primitives::Transaction> &transactions,
        const primitives::Timestamp &timestamp,
        const primitives::BlockHash &sequencer_block_hash) = 0;

    virtual outcome::result<void> updateCommitmentState(
        const std::string &session_id,
        const primitives::CommitmentState &state) = 0;

    virtual outcome::result<primitives::ExecutedBlockMetadata>
    getExecutedBlockMetadata(primitives::BlockNumber number) = 0;

    virtual outcome::result<primitives::ExecutedBlockMetadata>
    getExecutedBlockMetadata(const primitives::BlockHash &hash) = 0;

    virtual bool supportsRollback() const = 0;

    /// Discards blocks above `number`
    /// @return metadata of the new head
    virtual outcome::result<primitives::ExecutedBlockMetadata> rollback(
        primitives::BlockNumber number) = 0;
  };

}  // namespace conductor::execution
