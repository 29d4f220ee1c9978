/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_storage.hpp"
#include "storage/spaces.hpp"

namespace conductor::storage {

  /// Spaced storages base interface
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve a pointer to the map representing particular storage space
     * @param space - identifier of required space
     * @return a pointer buffer storage for a space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;
  };

}  // namespace conductor::storage
