/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "da/namespace.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace conductor::da {

  /**
   * Access to the data availability network
   */
  class DaClient {
   public:
    virtual ~DaClient() = default;

    virtual outcome::result<primitives::CelestiaHeight> getLatestHeight() = 0;

    /// Raw blobs published under `ns` at `height`
    virtual outcome::result<std::vector<common::Buffer>> getBlobs(
        primitives::CelestiaHeight height, const Namespace &ns) = 0;
  };

}  // namespace conductor::da
