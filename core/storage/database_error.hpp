/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace conductor::storage {

  /**
   * @brief universal database interface error
   */
  enum class DatabaseError : uint8_t {
    NOT_FOUND = 1,
    CORRUPTION,
    NOT_SUPPORTED,
    INVALID_ARGUMENT,
    IO_ERROR,
    STORAGE_GONE,
    UNKNOWN,
  };
  Q_ENUM_ERROR_CODE(DatabaseError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_FOUND:
        return "Entry not found";
      case E::CORRUPTION:
        return "Data corruption";
      case E::NOT_SUPPORTED:
        return "Operation not supported";
      case E::INVALID_ARGUMENT:
        return "Invalid argument";
      case E::IO_ERROR:
        return "IO error";
      case E::STORAGE_GONE:
        return "Storage instance has been uninitialized";
      case E::UNKNOWN:
        return "Unknown database error";
    }
    abort();
  }

}  // namespace conductor::storage
