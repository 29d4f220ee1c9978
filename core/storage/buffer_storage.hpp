/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace conductor::storage {

  using common::Buffer;
  using common::BufferView;

  /**
   * Key-value storage with byte-string keys and values.
   * Every write is durable once it returns successfully.
   */
  class BufferStorage {
   public:
    virtual ~BufferStorage() = default;

    /**
     * @brief Checks if given key-value binding exists in the storage.
     */
    virtual outcome::result<bool> contains(const BufferView &key) const = 0;

    /**
     * @brief Get value by key
     * @return DatabaseError::NOT_FOUND if there is no such key
     */
    virtual outcome::result<Buffer> get(const BufferView &key) const = 0;

    /**
     * @brief Get value by key
     * @return nullopt if there is no such key
     */
    virtual outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const = 0;

    /**
     * @brief Store value by key, replacing the previous one atomically
     */
    virtual outcome::result<void> put(const BufferView &key,
                                      Buffer value) = 0;

    /**
     * @brief Remove value by key
     */
    virtual outcome::result<void> remove(const BufferView &key) = 0;
  };

}  // namespace conductor::storage
