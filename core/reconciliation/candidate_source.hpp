/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "outcome/outcome.hpp"
#include "primitives/candidate_block.hpp"
#include "primitives/execution.hpp"
#include "utils/bounded_channel.hpp"

namespace conductor::reconciliation {

  using CandidateChannel = BoundedChannel<primitives::CandidateBlock>;

  /**
   * Producer of verified candidates of one origin. Candidates are sent to
   * the channel in strictly increasing height order, starting at the
   * expected height the engine published before `start`.
   */
  class CandidateSource {
   public:
    virtual ~CandidateSource() = default;

    virtual primitives::Origin origin() const = 0;

    /**
     * Starts producing in the background. Blocks until the source checked
     * its remote endpoint against the session.
     */
    virtual outcome::result<void> start(
        const primitives::ExecutionSessionParameters &session,
        std::shared_ptr<CandidateChannel> channel) = 0;

    /// Cancels production, closes the channel and waits for the workers
    virtual void stop() = 0;
  };

}  // namespace conductor::reconciliation
