/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "merkle/proof.hpp"
#include "primitives/common.hpp"

namespace conductor::primitives {

  /**
   * @struct SequencerBlockHeader header of a sequencer block.
   * `data_hash` is the Merkle Tree Hash over the hashed block data, where the
   * first two items are `rollup_transactions_root` and the root of the
   * rollup ids.
   */
  struct SequencerBlockHeader {
    std::string chain_id;
    SequencerHeight height = 0;
    Timestamp time;
    common::Hash256 data_hash;
    Address proposer_address;
    common::Hash256 rollup_transactions_root;
    common::Hash256 rollup_ids_root;

    bool operator==(const SequencerBlockHeader &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SequencerBlockHeader &h) {
    return s << h.chain_id << h.height << h.time << h.data_hash
             << h.proposer_address << h.rollup_transactions_root
             << h.rollup_ids_root;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SequencerBlockHeader &h) {
    return s >> h.chain_id >> h.height >> h.time >> h.data_hash
        >> h.proposer_address >> h.rollup_transactions_root
        >> h.rollup_ids_root;
  }

  /**
   * @struct RollupTransactions transactions of one rollup in a sequencer
   * block, with the proof of `rollup_id || MTH(transactions)` in the
   * block's `rollup_transactions_root`
   */
  struct RollupTransactions {
    RollupId rollup_id;
    std::vector<Transaction> transactions;
    merkle::Proof proof;

    bool operator==(const RollupTransactions &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RollupTransactions &r) {
    return s << r.rollup_id << r.transactions << r.proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RollupTransactions &r) {
    return s >> r.rollup_id >> r.transactions >> r.proof;
  }

  /**
   * @struct FilteredSequencerBlock sequencer block as served to one rollup:
   * the header, that rollup's transactions if it has any, every rollup id
   * present in the block, and the two proofs tying both roots to
   * `data_hash`
   */
  struct FilteredSequencerBlock {
    BlockHash block_hash;
    SequencerBlockHeader header;
    std::optional<RollupTransactions> rollup_transactions;
    std::vector<RollupId> all_rollup_ids;
    merkle::Proof rollup_transactions_proof;
    merkle::Proof rollup_ids_proof;

    SequencerHeight height() const {
      return header.height;
    }
  };

}  // namespace conductor::primitives
