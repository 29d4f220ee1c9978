/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_spaces.hpp"

#include <algorithm>
#include <array>

#include <rocksdb/db.h>
#include <boost/assert.hpp>

namespace conductor::storage {

  static constexpr std::array kNames{"commitment"};
  static_assert(kNames.size() == Space::kTotal - 1);

  std::string spaceName(Space space) {
    BOOST_ASSERT(space < Space::kTotal);
    if (space == Space::kDefault) {
      return rocksdb::kDefaultColumnFamilyName;
    }
    return kNames.at(space - 1);
  }

  std::optional<Space> spaceByName(std::string_view name) {
    if (name == rocksdb::kDefaultColumnFamilyName) {
      return Space::kDefault;
    }
    const auto it = std::ranges::find(kNames, name);
    if (it == std::end(kNames)) {
      return std::nullopt;
    }
    return static_cast<Space>(std::distance(std::begin(kNames), it) + 1);
  }

}  // namespace conductor::storage
