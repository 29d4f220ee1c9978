/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/commitment_state_manager.hpp"

#include "storage/predefined_keys.hpp"

namespace conductor::state {

  CommitmentStateManager::CommitmentStateManager(
      std::shared_ptr<storage::SpacedStorage> storage,
      std::shared_ptr<execution::ExecutionDriver> driver)
      : storage_{storage->getSpace(storage::Space::kCommitment)},
        driver_{std::move(driver)},
        log_{log::createLogger("CommitmentState", "state")} {
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(driver_ != nullptr);
  }

  outcome::result<std::optional<primitives::CommitmentState>>
  CommitmentStateManager::read() const {
    OUTCOME_TRY(raw, storage_->tryGet(storage::kCommitmentStateKey));
    if (not raw) {
      return std::nullopt;
    }
    OUTCOME_TRY(stored, scale::decode<primitives::CommitmentState>(*raw));
    if (stored.firm.number > stored.soft.number) {
      return StateError::CORRUPTED;
    }
    return stored;
  }

  outcome::result<primitives::CommitmentState> CommitmentStateManager::load(
      const primitives::ExecutionSessionParameters &session) {
    OUTCOME_TRY(stored, read());
    const auto start = session.rollup_start_block_number;
    if (stored and stored->firm.number + 1 >= start) {
      SL_INFO(log_, "Loaded commitment state: {}", *stored);
      state_ = std::move(*stored);
      OUTCOME_TRY(driver_->updateCommitmentState(*state_));
      return state_.value();
    }

    // the pointers sit right before the first block of the session
    const primitives::BlockNumber pinned = start == 0 ? 0 : start - 1;
    OUTCOME_TRY(head, driver_->resolve(pinned));
    primitives::CommitmentState initial{
        .soft = head,
        .firm = head,
        .lowest_celestia_search_height =
            raised(session.celestia_start_height,
                   stored ? std::optional{stored->lowest_celestia_search_height}
                          : std::nullopt),
    };
    SL_INFO(log_,
            "{} commitment state pinned to the session start: {}",
            stored ? "Replacing stale" : "Initialized",
            initial);
    OUTCOME_TRY(persist(std::move(initial)));
    return state_.value();
  }

  outcome::result<void> CommitmentStateManager::advance(
      primitives::Origin origin,
      const primitives::ExecutedBlockMetadata &metadata,
      std::optional<primitives::CelestiaHeight> celestia_height) {
    if (not state_) {
      return StateError::NOT_LOADED;
    }
    auto next = *state_;
    switch (origin) {
      case primitives::Origin::Soft:
        if (metadata.number != next.soft.number + 1) {
          SL_ERROR(log_,
                   "Soft commitment {} does not follow {}",
                   metadata,
                   next.soft);
          return StateError::NON_CONSECUTIVE;
        }
        next.soft = metadata;
        break;
      case primitives::Origin::Firm:
        if (metadata.number > next.soft.number) {
          SL_ERROR(log_,
                   "Firm commitment {} is above soft commitment {}",
                   metadata,
                   next.soft);
          return StateError::FIRM_AHEAD_OF_SOFT;
        }
        if (metadata.number != next.firm.number + 1) {
          SL_ERROR(log_,
                   "Firm commitment {} does not follow {}",
                   metadata,
                   next.firm);
          return StateError::NON_CONSECUTIVE;
        }
        next.firm = metadata;
        next.lowest_celestia_search_height =
            raised(next.lowest_celestia_search_height, celestia_height);
        break;
    }
    OUTCOME_TRY(persist(std::move(next)));
    if (origin == primitives::Origin::Firm) {
      OUTCOME_TRY(forgetSoftContent(metadata.number, metadata.number));
    }
    return outcome::success();
  }

  outcome::result<void> CommitmentStateManager::advanceBoth(
      const primitives::ExecutedBlockMetadata &metadata,
      std::optional<primitives::CelestiaHeight> celestia_height) {
    if (not state_) {
      return StateError::NOT_LOADED;
    }
    auto next = *state_;
    if (metadata.number != next.firm.number + 1
        or metadata.number != next.soft.number + 1) {
      SL_ERROR(log_,
               "Commitment {} does not follow soft {} and firm {}",
               metadata,
               next.soft,
               next.firm);
      return StateError::NON_CONSECUTIVE;
    }
    next.soft = metadata;
    next.firm = metadata;
    next.lowest_celestia_search_height =
        raised(next.lowest_celestia_search_height, celestia_height);
    OUTCOME_TRY(persist(std::move(next)));
    return forgetSoftContent(metadata.number, metadata.number);
  }

  outcome::result<void> CommitmentStateManager::rollback(
      const primitives::ExecutedBlockMetadata &metadata) {
    if (not state_) {
      return StateError::NOT_LOADED;
    }
    auto next = *state_;
    if (metadata.number < next.firm.number) {
      SL_ERROR(log_,
               "Rollback target {} is below firm commitment {}",
               metadata,
               next.firm);
      return StateError::FIRM_AHEAD_OF_SOFT;
    }
    SL_WARN(log_,
            "Soft commitment rolled back from {} to {}",
            next.soft,
            metadata);
    const auto rolled_back_from = next.soft.number;
    next.soft = metadata;
    OUTCOME_TRY(persist(std::move(next)));
    if (rolled_back_from > metadata.number) {
      OUTCOME_TRY(forgetSoftContent(metadata.number + 1, rolled_back_from));
    }
    return outcome::success();
  }

  outcome::result<void> CommitmentStateManager::recordSoftContent(
      primitives::BlockNumber number,
      const primitives::ContentDigest &digest) {
    OUTCOME_TRY(encoded, scale::encode(digest));
    return storage_->put(softContentKey(number),
                         common::Buffer{std::move(encoded)});
  }

  outcome::result<std::optional<primitives::ContentDigest>>
  CommitmentStateManager::softContent(primitives::BlockNumber number) const {
    OUTCOME_TRY(raw, storage_->tryGet(softContentKey(number)));
    if (not raw) {
      return std::nullopt;
    }
    OUTCOME_TRY(digest, scale::decode<primitives::ContentDigest>(*raw));
    return digest;
  }

  outcome::result<void> CommitmentStateManager::forgetSoftContent(
      primitives::BlockNumber from, primitives::BlockNumber to) {
    BOOST_ASSERT(from <= to);
    for (auto number = from;; ++number) {
      OUTCOME_TRY(storage_->remove(softContentKey(number)));
      if (number == to) {
        return outcome::success();
      }
    }
  }

  common::Buffer CommitmentStateManager::softContentKey(
      primitives::BlockNumber number) {
    common::Buffer key(storage::kSoftContentKeyPrefix);
    key.putUint64(number);
    return key;
  }

  outcome::result<void> CommitmentStateManager::setCelestiaSearchHeight(
      primitives::CelestiaHeight height) {
    if (not state_) {
      return StateError::NOT_LOADED;
    }
    if (height <= state_->lowest_celestia_search_height) {
      return outcome::success();
    }
    auto next = *state_;
    next.lowest_celestia_search_height = height;
    return persist(std::move(next));
  }

  outcome::result<void> CommitmentStateManager::persist(
      primitives::CommitmentState next) {
    OUTCOME_TRY(encoded, scale::encode(next));
    OUTCOME_TRY(storage_->put(storage::kCommitmentStateKey,
                              common::Buffer{std::move(encoded)}));
    state_ = std::move(next);
    SL_DEBUG(log_, "Commitment state persisted: {}", *state_);
    return driver_->updateCommitmentState(*state_);
  }

  primitives::CelestiaHeight CommitmentStateManager::raised(
      primitives::CelestiaHeight current,
      std::optional<primitives::CelestiaHeight> candidate) {
    if (candidate and *candidate > current) {
      return *candidate;
    }
    return current;
  }

}  // namespace conductor::state
