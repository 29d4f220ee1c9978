/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "execution/execution_driver.hpp"

#include <limits>

namespace conductor::execution {

  ExecutionDriver::ExecutionDriver(std::shared_ptr<ExecutionClient> client,
                                   RetryPolicy retry,
                                   std::shared_ptr<Cancellation> cancellation)
      : client_{std::move(client)},
        retry_{std::move(retry)},
        cancellation_{std::move(cancellation)},
        log_{log::createLogger("ExecutionDriver", "execution")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(cancellation_ != nullptr);
  }

  outcome::result<primitives::ExecutionSession> ExecutionDriver::initSession() {
    std::lock_guard lock(mutex_);
    OUTCOME_TRY(session,
                withRetry("InitExecutionSession",
                          [&] { return client_->initExecutionSession(); }));
    session_id_ = session.session_id;
    SL_INFO(log_,
            "Execution session '{}' opened: rollup blocks {}..{}, sequencer "
            "chain '{}' from height {}, DA chain '{}'",
            session.session_id,
            session.parameters.rollup_start_block_number,
            session.parameters.isBounded()
                ? std::to_string(session.parameters.rollup_end_block_number)
                : std::string{"unbounded"},
            session.parameters.sequencer_chain_id,
            session.parameters.sequencer_start_block_height,
            session.parameters.celestia_chain_id);
    return session;
  }

  void ExecutionDriver::setHead(primitives::ExecutedBlockMetadata head) {
    std::lock_guard lock(mutex_);
    head_ = std::move(head);
  }

  primitives::ExecutedBlockMetadata ExecutionDriver::head() const {
    std::lock_guard lock(mutex_);
    return head_;
  }

  outcome::result<primitives::ExecutedBlockMetadata> ExecutionDriver::execute(
      const primitives::ExecutedBlockMetadata &parent,
      const primitives::CandidateBlock &block) {
    std::lock_guard lock(mutex_);
    if (session_id_.empty()) {
      return ExecutionError::NO_SESSION;
    }
    if (parent.hash != head_.hash or parent.number != head_.number) {
      SL_WARN(log_,
              "Refusing to execute on top of {}, execution head is {}",
              parent,
              head_);
      return ExecutionError::ORDERING_FAULT;
    }
    if (parent.number == std::numeric_limits<primitives::BlockNumber>::max()) {
      return ExecutionError::NUMBER_OVERFLOW;
    }

    auto res = withRetry(
        "ExecuteBlock",
        [&] {
          return client_->executeBlock(session_id_,
                                       parent.hash,
                                       block.transactions,
                                       block.timestamp(),
                                       block.block_hash);
        },
        [](const std::error_code &error) {
          return error == ExecutionClientError::PARENT_MISMATCH;
        });
    if (res.has_error()
        and res.error() == ExecutionClientError::PARENT_MISMATCH) {
      SL_WARN(log_,
              "Execution engine head is not {}, the driver's view is stale",
              parent);
      return ExecutionError::ORDERING_FAULT;
    }
    OUTCOME_TRY(executed, std::move(res));

    if (executed.number != parent.number + 1) {
      SL_ERROR(log_,
               "Execution engine returned block #{} on top of #{}",
               executed.number,
               parent.number);
      return ExecutionError::WRONG_BLOCK;
    }
    if (executed.parent_hash != parent.hash) {
      SL_ERROR(log_,
               "Execution engine built {} on top of {}, requested {}",
               executed,
               executed.parent_hash,
               parent.hash);
      return ExecutionError::WRONG_PARENT;
    }
    if (not executed.sequencer_block_hash) {
      executed.sequencer_block_hash = block.block_hash;
    }
    executed.sequencer_height = block.height();
    SL_DEBUG(log_,
             "Executed {} block {} with {} transactions as {}",
             block.origin,
             block.block_hash,
             block.transactions.size(),
             executed);
    head_ = executed;
    return executed;
  }

  outcome::result<primitives::ExecutedBlockMetadata> ExecutionDriver::resolve(
      primitives::BlockNumber number) {
    std::lock_guard lock(mutex_);
    return withRetry(fmt::format("GetExecutedBlockMetadata #{}", number),
                     [&] { return client_->getExecutedBlockMetadata(number); });
  }

  outcome::result<void> ExecutionDriver::updateCommitmentState(
      const primitives::CommitmentState &state) {
    std::lock_guard lock(mutex_);
    if (session_id_.empty()) {
      return ExecutionError::NO_SESSION;
    }
    return withRetry("UpdateCommitmentState", [&] {
      return client_->updateCommitmentState(session_id_, state);
    });
  }

  bool ExecutionDriver::supportsRollback() const {
    return client_->supportsRollback();
  }

  outcome::result<primitives::ExecutedBlockMetadata> ExecutionDriver::rollback(
      primitives::BlockNumber number) {
    std::lock_guard lock(mutex_);
    OUTCOME_TRY(new_head, withRetry(fmt::format("Rollback to #{}", number), [&] {
                  return client_->rollback(number);
                }));
    if (new_head.number != number) {
      SL_ERROR(log_,
               "Rollback to #{} left the execution head at {}",
               number,
               new_head);
      return ExecutionError::WRONG_BLOCK;
    }
    SL_INFO(log_, "Execution engine rolled back to {}", new_head);
    head_ = new_head;
    return new_head;
  }

}  // namespace conductor::execution
