/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>

#include "common/blob.hpp"
#include "common/buffer.hpp"

CONDUCTOR_BLOB_STRICT_TYPEDEF(conductor::primitives, RollupId, 32);

namespace conductor::primitives {
  /// Rollup block number, as reported by the execution engine
  using BlockNumber = uint64_t;
  /// Height of a sequencer block
  using SequencerHeight = uint64_t;
  /// Height of a DA (Celestia) block
  using CelestiaHeight = uint64_t;

  using BlockHash = common::Hash256;
  using Address = common::Blob<20>;
  using Transaction = common::Buffer;

  struct Timestamp {
    int64_t seconds = 0;
    uint32_t nanos = 0;

    bool operator==(const Timestamp &) const = default;
    auto operator<=>(const Timestamp &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Timestamp &t) {
    return s << t.seconds << t.nanos;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Timestamp &t) {
    return s >> t.seconds >> t.nanos;
  }

}  // namespace conductor::primitives

template <>
struct fmt::formatter<conductor::primitives::Timestamp> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const conductor::primitives::Timestamp &t,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}.{:09}", t.seconds, t.nanos);
  }
};
