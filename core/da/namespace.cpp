/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/namespace.hpp"

#include "crypto/sha/sha256.hpp"

namespace conductor::da {

  Namespace namespaceFromBytes(common::BufferView bytes) {
    auto hash = crypto::sha256(bytes);
    Namespace ns;
    std::copy_n(hash.begin(), Namespace::size(), ns.begin());
    return ns;
  }

  Namespace sequencerNamespace(std::string_view sequencer_chain_id) {
    return namespaceFromBytes(common::str2byte(sequencer_chain_id));
  }

}  // namespace conductor::da
