/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"

namespace conductor::merkle {

  /**
   * Inclusion proof of one leaf in a Merkle Tree Hash.
   */
  struct Proof {
    /// Sibling hashes from the leaf level up to the root
    std::vector<common::Hash256> audit_path;
    uint64_t leaf_index = 0;
    /// Number of leaves in the tree
    uint64_t tree_size = 0;

    bool operator==(const Proof &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Proof &proof) {
    return s << proof.audit_path << proof.leaf_index << proof.tree_size;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Proof &proof) {
    return s >> proof.audit_path >> proof.leaf_index >> proof.tree_size;
  }

}  // namespace conductor::merkle
