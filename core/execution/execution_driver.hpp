/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "execution/execution_client.hpp"
#include "log/logger.hpp"
#include "primitives/candidate_block.hpp"
#include "utils/cancellation.hpp"
#include "utils/retry.hpp"

namespace conductor::execution {

  enum class ExecutionError : uint8_t {
    ORDERING_FAULT = 1,
    WRONG_BLOCK,
    WRONG_PARENT,
    NUMBER_OVERFLOW,
    NO_SESSION,
  };
  Q_ENUM_ERROR_CODE(ExecutionError) {
    using E = decltype(e);
    switch (e) {
      case E::ORDERING_FAULT:
        return "Requested parent is not the current execution head";
      case E::WRONG_BLOCK:
        return "Executed block number does not follow its parent";
      case E::WRONG_PARENT:
        return "Executed block is not built on the requested parent";
      case E::NUMBER_OVERFLOW:
        return "Execution head number cannot be incremented";
      case E::NO_SESSION:
        return "No execution session is open";
    }
    abort();
  }

  /**
   * Serializes calls to the execution engine and checks its responses.
   * Holds the driver's view of the execution head: a block is executed only
   * on top of it, and the head moves to every executed block.
   * Client failures are retried with backoff until cancelled.
   */
  class ExecutionDriver {
   public:
    ExecutionDriver(std::shared_ptr<ExecutionClient> client,
                    RetryPolicy retry,
                    std::shared_ptr<Cancellation> cancellation);

    outcome::result<primitives::ExecutionSession> initSession();

    const std::string &sessionId() const {
      return session_id_;
    }

    /// Sets the driver's view of the execution head
    void setHead(primitives::ExecutedBlockMetadata head);

    primitives::ExecutedBlockMetadata head() const;

    /**
     * Executes `block` on top of `parent`.
     * @return ORDERING_FAULT if `parent` is not the current head or the
     * engine reports a different head, the latter is not retried
     */
    outcome::result<primitives::ExecutedBlockMetadata> execute(
        const primitives::ExecutedBlockMetadata &parent,
        const primitives::CandidateBlock &block);

    /// Metadata of the executed block `number`, as the engine reports it
    outcome::result<primitives::ExecutedBlockMetadata> resolve(
        primitives::BlockNumber number);

    outcome::result<void> updateCommitmentState(
        const primitives::CommitmentState &state);

    bool supportsRollback() const;

    /// Rolls the engine back to `number` and moves the head there
    outcome::result<primitives::ExecutedBlockMetadata> rollback(
        primitives::BlockNumber number);

   private:
    template <typename F>
    auto withRetry(std::string_view what, F &&f) {
      return retryWithBackoff(
          retry_, *cancellation_, log_, what, std::forward<F>(f));
    }

    template <typename F, typename Final>
    auto withRetry(std::string_view what, F &&f, Final &&is_final) {
      return retryWithBackoff(retry_,
                              *cancellation_,
                              log_,
                              what,
                              std::forward<F>(f),
                              std::forward<Final>(is_final));
    }

    std::shared_ptr<ExecutionClient> client_;
    RetryPolicy retry_;
    std::shared_ptr<Cancellation> cancellation_;
    log::Logger log_;

    // one call to the engine at a time
    mutable std::mutex mutex_;
    std::string session_id_;
    primitives::ExecutedBlockMetadata head_;
  };

}  // namespace conductor::execution
