/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "primitives/celestia_blobs.hpp"

namespace conductor::da {

  enum class BlobCodecError : uint8_t {
    TRAILING_BYTES = 1,
  };
  Q_ENUM_ERROR_CODE(BlobCodecError) {
    using E = decltype(e);
    switch (e) {
      case E::TRAILING_BYTES:
        return "Blob has bytes after its encoded value";
    }
    abort();
  }

  outcome::result<common::Buffer> encodeBlob(
      const primitives::CelestiaBlob &blob);

  outcome::result<primitives::CelestiaBlob> decodeBlob(
      common::BufferView bytes);

}  // namespace conductor::da
