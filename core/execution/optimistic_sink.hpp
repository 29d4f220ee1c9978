/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/candidate_block.hpp"

namespace conductor::execution {

  /**
   * Receiver of soft candidates before they are committed, e.g. an
   * auctioneer building on top of them
   */
  class OptimisticSink {
   public:
    virtual ~OptimisticSink() = default;

    virtual outcome::result<void> onSoftCandidate(
        const primitives::CandidateBlock &block) = 0;
  };

}  // namespace conductor::execution
