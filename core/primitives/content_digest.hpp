/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/candidate_block.hpp"
#include "primitives/commitments.hpp"

namespace conductor::primitives {

  /// What a soft-executed block was built from
  struct ContentDigest {
    BlockHash sequencer_block_hash;
    common::Hash256 transactions_root;

    static ContentDigest of(const CandidateBlock &block) {
      return {
          .sequencer_block_hash = block.block_hash,
          .transactions_root = transactionsRoot(block.transactions),
      };
    }

    bool operator==(const ContentDigest &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ContentDigest &d) {
    return s << d.sequencer_block_hash << d.transactions_root;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ContentDigest &d) {
    return s >> d.sequencer_block_hash >> d.transactions_root;
  }

}  // namespace conductor::primitives
