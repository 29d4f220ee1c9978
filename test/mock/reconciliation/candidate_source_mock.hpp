/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "reconciliation/candidate_source.hpp"

#include <gmock/gmock.h>

namespace conductor::reconciliation {

  class CandidateSourceMock : public CandidateSource {
   public:
    MOCK_METHOD(primitives::Origin, origin, (), (const, override));

    MOCK_METHOD(outcome::result<void>,
                start,
                (const primitives::ExecutionSessionParameters &,
                 std::shared_ptr<CandidateChannel>),
                (override));

    MOCK_METHOD(void, stop, (), (override));
  };

}  // namespace conductor::reconciliation
