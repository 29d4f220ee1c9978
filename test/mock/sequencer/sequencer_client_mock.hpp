/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "sequencer/sequencer_client.hpp"

#include <gmock/gmock.h>

namespace conductor::sequencer {

  class SequencerClientMock : public SequencerClient {
   public:
    MOCK_METHOD(outcome::result<std::string>, getChainId, (), (override));

    MOCK_METHOD(outcome::result<primitives::SequencerHeight>,
                getLatestHeight,
                (),
                (override));

    MOCK_METHOD(outcome::result<primitives::FilteredSequencerBlock>,
                getFilteredBlock,
                (primitives::SequencerHeight, const primitives::RollupId &),
                (override));
  };

}  // namespace conductor::sequencer
