/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace conductor::devnet {

  enum class DevnetError : uint8_t {
    UNAVAILABLE = 1,
    NO_SUCH_BLOCK,
    UNKNOWN_SESSION,
    ROLLBACK_UNSUPPORTED,
  };
  Q_ENUM_ERROR_CODE(DevnetError) {
    using E = decltype(e);
    switch (e) {
      case E::UNAVAILABLE:
        return "Loopback endpoint is unavailable";
      case E::NO_SUCH_BLOCK:
        return "Block is not known";
      case E::UNKNOWN_SESSION:
        return "Execution session id is not the current one";
      case E::ROLLBACK_UNSUPPORTED:
        return "Rollback is not supported";
    }
    abort();
  }

}  // namespace conductor::devnet
