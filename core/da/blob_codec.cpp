/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/blob_codec.hpp"

namespace conductor::da {

  outcome::result<common::Buffer> encodeBlob(
      const primitives::CelestiaBlob &blob) {
    OUTCOME_TRY(bytes, scale::encode(blob));
    return common::Buffer{std::move(bytes)};
  }

  outcome::result<primitives::CelestiaBlob> decodeBlob(
      common::BufferView bytes) {
    scale::ScaleDecoderStream s{bytes};
    primitives::CelestiaBlob blob;
    try {
      s >> blob;
    } catch (const std::system_error &e) {
      return e.code();
    }
    if (s.hasMore(1)) {
      return BlobCodecError::TRAILING_BYTES;
    }
    return blob;
  }

}  // namespace conductor::da
