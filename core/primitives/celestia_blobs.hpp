/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>
#include <vector>

#include "merkle/proof.hpp"
#include "primitives/sequencer_block.hpp"

namespace conductor::primitives {

  /**
   * @struct SubmittedMetadata header blob written to the DA network for
   * every sequencer block
   */
  struct SubmittedMetadata {
    BlockHash block_hash;
    SequencerBlockHeader header;
    std::vector<RollupId> rollup_ids;
    merkle::Proof rollup_transactions_proof;
    merkle::Proof rollup_ids_proof;

    SequencerHeight height() const {
      return header.height;
    }

    bool containsRollup(const RollupId &id) const {
      return std::find(rollup_ids.begin(), rollup_ids.end(), id)
          != rollup_ids.end();
    }

    bool operator==(const SubmittedMetadata &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SubmittedMetadata &m) {
    return s << m.block_hash << m.header << m.rollup_ids
             << m.rollup_transactions_proof << m.rollup_ids_proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SubmittedMetadata &m) {
    return s >> m.block_hash >> m.header >> m.rollup_ids
        >> m.rollup_transactions_proof >> m.rollup_ids_proof;
  }

  /**
   * @struct SubmittedRollupData rollup blob: one rollup's transactions of
   * the sequencer block `sequencer_block_hash`
   */
  struct SubmittedRollupData {
    BlockHash sequencer_block_hash;
    RollupId rollup_id;
    std::vector<Transaction> transactions;
    merkle::Proof proof;

    bool operator==(const SubmittedRollupData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SubmittedRollupData &d) {
    return s << d.sequencer_block_hash << d.rollup_id << d.transactions
             << d.proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SubmittedRollupData &d) {
    return s >> d.sequencer_block_hash >> d.rollup_id >> d.transactions
        >> d.proof;
  }

  /// Decoded DA blob, tagged by variant index
  using CelestiaBlob = std::variant<SubmittedMetadata, SubmittedRollupData>;

}  // namespace conductor::primitives
