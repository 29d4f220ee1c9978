/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "primitives/common.hpp"

namespace conductor::primitives {

  /**
   * @struct ExecutionSessionParameters defines the mapping between rollup
   * block numbers and sequencer heights for one execution session
   */
  struct ExecutionSessionParameters {
    RollupId rollup_id;
    BlockNumber rollup_start_block_number = 0;
    /// 0 means the session is unbounded
    BlockNumber rollup_end_block_number = 0;
    std::string sequencer_chain_id;
    SequencerHeight sequencer_start_block_height = 0;
    std::string celestia_chain_id;
    uint64_t celestia_search_height_max_look_ahead = 0;
    /// DA height the firm search starts from when no state is stored
    CelestiaHeight celestia_start_height = 0;

    bool isBounded() const {
      return rollup_end_block_number != 0;
    }

    bool operator==(const ExecutionSessionParameters &) const = default;
  };

  /// Parameters and the id the execution engine assigned to the session
  struct ExecutionSession {
    std::string session_id;
    ExecutionSessionParameters parameters;
  };

  struct ExecutedBlockMetadata {
    BlockNumber number = 0;
    BlockHash hash;
    BlockHash parent_hash;
    Timestamp timestamp;
    /// Sequencer block the rollup block was built from, if known
    std::optional<BlockHash> sequencer_block_hash;
    std::optional<SequencerHeight> sequencer_height;

    bool operator==(const ExecutedBlockMetadata &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ExecutedBlockMetadata &m) {
    return s << m.number << m.hash << m.parent_hash << m.timestamp
             << m.sequencer_block_hash << m.sequencer_height;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ExecutedBlockMetadata &m) {
    return s >> m.number >> m.hash >> m.parent_hash >> m.timestamp
        >> m.sequencer_block_hash >> m.sequencer_height;
  }

  /**
   * @struct CommitmentState the highest soft and firm executed blocks, and
   * the DA height the firm search continues from.
   * firm.number <= soft.number always holds.
   */
  struct CommitmentState {
    ExecutedBlockMetadata soft;
    ExecutedBlockMetadata firm;
    CelestiaHeight lowest_celestia_search_height = 0;

    bool operator==(const CommitmentState &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const CommitmentState &c) {
    return s << c.soft << c.firm << c.lowest_celestia_search_height;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, CommitmentState &c) {
    return s >> c.soft >> c.firm >> c.lowest_celestia_search_height;
  }

}  // namespace conductor::primitives

template <>
struct fmt::formatter<conductor::primitives::ExecutedBlockMetadata> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const conductor::primitives::ExecutedBlockMetadata &m,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "#{} ({})", m.number, m.hash);
  }
};

template <>
struct fmt::formatter<conductor::primitives::CommitmentState> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const conductor::primitives::CommitmentState &c,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "soft {}, firm {}, celestia height {}",
                          c.soft,
                          c.firm,
                          c.lowest_celestia_search_height);
  }
};
