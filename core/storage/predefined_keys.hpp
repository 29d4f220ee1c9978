/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"

namespace conductor::storage {
  using namespace common::literals;

  /// The single commitment state record
  inline const common::Buffer kCommitmentStateKey =
      ":conductor:commitment_state"_buf;

  /// Followed by the big-endian rollup number of a soft block not yet firm
  inline const common::Buffer kSoftContentKeyPrefix =
      ":conductor:soft_content:"_buf;

}  // namespace conductor::storage
