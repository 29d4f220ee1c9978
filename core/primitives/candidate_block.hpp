/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "primitives/sequencer_block.hpp"

namespace conductor::primitives {

  /// Which source produced a block
  enum class Origin : uint8_t {
    Soft,
    Firm,
  };

  /**
   * @struct CandidateBlock verified sequencer block scoped to one rollup.
   * Created by the block normalizer only.
   */
  struct CandidateBlock {
    Origin origin = Origin::Soft;
    BlockHash block_hash;
    SequencerBlockHeader header;
    RollupId rollup_id;
    std::vector<Transaction> transactions;
    std::vector<RollupId> all_rollup_ids;
    /// DA height a firm block was found at
    CelestiaHeight celestia_height = 0;

    SequencerHeight height() const {
      return header.height;
    }

    const Timestamp &timestamp() const {
      return header.time;
    }
  };

}  // namespace conductor::primitives

template <>
struct fmt::formatter<conductor::primitives::Origin> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const conductor::primitives::Origin &origin,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(),
        "{}",
        origin == conductor::primitives::Origin::Soft ? "soft" : "firm");
  }
};
