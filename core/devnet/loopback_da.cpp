/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/loopback_da.hpp"

#include "da/blob_codec.hpp"
#include "devnet/devnet_error.hpp"

namespace conductor::devnet {

  bool LoopbackDa::injectFailure() {
    auto left = failures_to_inject_.load();
    while (left > 0) {
      if (failures_to_inject_.compare_exchange_weak(left, left - 1)) {
        return true;
      }
    }
    return false;
  }

  void LoopbackDa::failNext(size_t count) {
    failures_to_inject_ = count;
  }

  outcome::result<primitives::CelestiaHeight> LoopbackDa::getLatestHeight() {
    if (injectFailure()) {
      return DevnetError::UNAVAILABLE;
    }
    return network_.sharedAccess([](const Network &n) { return n.head; });
  }

  outcome::result<std::vector<common::Buffer>> LoopbackDa::getBlobs(
      primitives::CelestiaHeight height, const da::Namespace &ns) {
    if (injectFailure()) {
      return DevnetError::UNAVAILABLE;
    }
    return network_.exclusiveAccess(
        [&](Network &n) -> outcome::result<std::vector<common::Buffer>> {
          n.requested.push_back(height);
          if (height > n.head) {
            return DevnetError::NO_SUCH_BLOCK;
          }
          auto it = n.blobs.find({height, ns});
          if (it == n.blobs.end()) {
            return std::vector<common::Buffer>{};
          }
          return it->second;
        });
  }

  void LoopbackDa::post(primitives::CelestiaHeight height,
                        const da::Namespace &ns,
                        common::Buffer blob) {
    network_.exclusiveAccess([&](Network &n) {
      n.blobs[{height, ns}].emplace_back(std::move(blob));
      n.head = std::max(n.head, height);
    });
  }

  outcome::result<void> LoopbackDa::postBlock(
      primitives::CelestiaHeight height,
      const SequencerBlock &block,
      const std::vector<primitives::RollupId> &rollups) {
    OUTCOME_TRY(header, da::encodeBlob(block.metadata()));
    post(height,
         da::sequencerNamespace(block.header.chain_id),
         std::move(header));
    for (auto &rollup_id : rollups) {
      auto data = block.rollupData(rollup_id);
      if (not data) {
        continue;
      }
      OUTCOME_TRY(blob, da::encodeBlob(std::move(*data)));
      post(height, da::namespaceFromBytes(rollup_id), std::move(blob));
    }
    return outcome::success();
  }

  void LoopbackDa::setHead(primitives::CelestiaHeight height) {
    network_.exclusiveAccess(
        [&](Network &n) { n.head = std::max(n.head, height); });
  }

  std::vector<primitives::CelestiaHeight> LoopbackDa::requestedHeights() const {
    return network_.sharedAccess(
        [](const Network &n) { return n.requested; });
  }

}  // namespace conductor::devnet
