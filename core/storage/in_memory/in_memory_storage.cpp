/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"

namespace conductor::storage {

  outcome::result<bool> InMemoryStorage::contains(const BufferView &key) const {
    std::lock_guard lock(mutex_);
    return storage_.contains(Buffer{key});
  }

  outcome::result<Buffer> InMemoryStorage::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (value.has_value()) {
      return std::move(value.value());
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<Buffer>> InMemoryStorage::tryGet(
      const BufferView &key) const {
    std::lock_guard lock(mutex_);
    if (auto it = storage_.find(Buffer{key}); it != storage_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const BufferView &key,
                                             Buffer value) {
    std::lock_guard lock(mutex_);
    storage_[Buffer{key}] = std::move(value);
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const BufferView &key) {
    std::lock_guard lock(mutex_);
    storage_.erase(Buffer{key});
    return outcome::success();
  }

  size_t InMemoryStorage::size() const {
    std::lock_guard lock(mutex_);
    return storage_.size();
  }

}  // namespace conductor::storage
