/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace conductor::da {

  /// DA namespace blobs are published under
  using Namespace = common::Blob<10>;

  /// First 10 bytes of SHA-256 of `bytes`
  Namespace namespaceFromBytes(common::BufferView bytes);

  /// Namespace of a sequencer chain's header blobs
  Namespace sequencerNamespace(std::string_view sequencer_chain_id);

}  // namespace conductor::da
