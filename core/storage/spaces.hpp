/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace conductor::storage {

  enum Space : uint8_t {
    // must have spaces
    kDefault = 0,

    // application-defined spaces
    kCommitment,

    kTotal
  };
}  // namespace conductor::storage
