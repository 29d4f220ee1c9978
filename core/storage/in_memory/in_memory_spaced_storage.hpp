/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace conductor::storage {

  class InMemorySpacedStorage : public SpacedStorage {
   public:
    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      std::lock_guard lock(mutex_);
      auto it = spaces_.find(space);
      if (it != spaces_.end()) {
        return it->second;
      }
      return spaces_.emplace(space, std::make_shared<InMemoryStorage>())
          .first->second;
    }

   private:
    std::mutex mutex_;
    std::map<Space, std::shared_ptr<InMemoryStorage>> spaces_;
  };

}  // namespace conductor::storage
