/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <compare>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace conductor::common {

  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    auto operator<=>(const BufferView &other) const {
      return std::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    bool operator==(const BufferView &other) const {
      return std::ranges::equal(*this, other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

  /// View of the bytes of a string, without copying
  inline BufferView str2byte(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

}  // namespace conductor::common

namespace conductor {
  using common::BufferView;
}  // namespace conductor

template <>
struct fmt::formatter<conductor::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const conductor::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      return fmt::format_to(ctx.out(), "<empty>");
    }
    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(
          ctx.out(),
          "0x{}…{}",
          conductor::common::hex_lower(view.first(2)),
          conductor::common::hex_lower(view.last(2)));
    }
    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
