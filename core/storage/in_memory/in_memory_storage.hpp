/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "storage/buffer_storage.hpp"

namespace conductor::storage {

  /**
   * Simple storage that conforms BufferStorage interface.
   * Used by tests and by the dev mode, where nothing has to survive restart.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::map<Buffer, Buffer> storage_;
  };

}  // namespace conductor::storage
