/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "execution/optimistic_sink.hpp"

#include <gmock/gmock.h>

namespace conductor::execution {

  class OptimisticSinkMock : public OptimisticSink {
   public:
    MOCK_METHOD(outcome::result<void>,
                onSoftCandidate,
                (const primitives::CandidateBlock &),
                (override));
  };

}  // namespace conductor::execution
