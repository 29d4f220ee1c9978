/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <fmt/format.h>

#include "primitives/execution.hpp"

namespace conductor::reconciliation {

  enum class EngineState : uint8_t {
    Uninitialized,
    Syncing,
    Following,
    /// Session ended, waiting for the execution engine to open the next one
    AwaitingSession,
    Halted,
  };

  struct EngineStatus {
    EngineState state = EngineState::Uninitialized;
    /// Message of the error the engine halted with
    std::optional<std::string> halt_reason;
    primitives::ExecutedBlockMetadata soft;
    primitives::ExecutedBlockMetadata firm;
    primitives::CelestiaHeight celestia_height = 0;
    bool firm_source_degraded = false;
    size_t consecutive_firm_failures = 0;
  };

  class StatusProvider {
   public:
    virtual ~StatusProvider() = default;

    virtual EngineStatus status() const = 0;

    /// False once halted
    virtual bool isHealthy() const = 0;
  };

}  // namespace conductor::reconciliation

template <>
struct fmt::formatter<conductor::reconciliation::EngineState>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(conductor::reconciliation::EngineState state,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using E = conductor::reconciliation::EngineState;
    std::string_view name = "unknown";
    switch (state) {
      case E::Uninitialized:
        name = "uninitialized";
        break;
      case E::Syncing:
        name = "syncing";
        break;
      case E::Following:
        name = "following";
        break;
      case E::AwaitingSession:
        name = "awaiting-session";
        break;
      case E::Halted:
        name = "halted";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
