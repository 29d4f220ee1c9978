/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>

#include "da/da_client.hpp"
#include "devnet/block_builder.hpp"
#include "utils/safe_object.hpp"

namespace conductor::devnet {

  /// Data availability network kept in memory
  class LoopbackDa final : public da::DaClient {
   public:
    outcome::result<primitives::CelestiaHeight> getLatestHeight() override;

    outcome::result<std::vector<common::Buffer>> getBlobs(
        primitives::CelestiaHeight height, const da::Namespace &ns) override;

    /// Publishes a raw blob, raising the head to `height`
    void post(primitives::CelestiaHeight height,
              const da::Namespace &ns,
              common::Buffer blob);

    /**
     * Publishes the header blob of `block` and the blobs of `rollups`
     * present in it, as a sequencer relayer would
     */
    outcome::result<void> postBlock(
        primitives::CelestiaHeight height,
        const SequencerBlock &block,
        const std::vector<primitives::RollupId> &rollups);

    /// Raises the head without publishing anything
    void setHead(primitives::CelestiaHeight height);

    /// Heights asked for by getBlobs, in order
    std::vector<primitives::CelestiaHeight> requestedHeights() const;

    void failNext(size_t count);

   private:
    struct Network {
      primitives::CelestiaHeight head = 0;
      std::map<std::pair<primitives::CelestiaHeight, da::Namespace>,
               std::vector<common::Buffer>>
          blobs;
      std::vector<primitives::CelestiaHeight> requested;
    };

    bool injectFailure();

    SafeObject<Network> network_;
    std::atomic_size_t failures_to_inject_ = 0;
  };

}  // namespace conductor::devnet
