/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/da_client.hpp"

#include <gmock/gmock.h>

namespace conductor::da {

  class DaClientMock : public DaClient {
   public:
    MOCK_METHOD(outcome::result<primitives::CelestiaHeight>,
                getLatestHeight,
                (),
                (override));

    MOCK_METHOD(outcome::result<std::vector<common::Buffer>>,
                getBlobs,
                (primitives::CelestiaHeight, const Namespace &),
                (override));
  };

}  // namespace conductor::da
