/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "storage/spaces.hpp"

namespace conductor::storage {

  /// Column family name of the space
  std::string spaceName(Space space);

  std::optional<Space> spaceByName(std::string_view name);

}  // namespace conductor::storage
