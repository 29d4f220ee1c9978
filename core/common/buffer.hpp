/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <scale/scale.hpp>

#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"

namespace conductor::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a 64-bit {@param n} number in this buffer. Will be serialized
     * as big-endian number.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint64(uint64_t n) {
      for (int shift = 56; shift >= 0; shift -= 8) {
        push_back(static_cast<uint8_t>(n >> shift));
      }
      return *this;
    }

    Buffer &put(std::string_view view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    BufferView view(size_t offset = 0,
                    size_t length = std::dynamic_extent) const {
      return std::span(*this).subspan(offset, length);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer(std::move(bytes));
    }

    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    static Buffer fromString(std::string_view src) {
      return Buffer(src.begin(), src.end());
    }

    bool operator==(const Buffer &other) const = default;
    auto operator<=>(const Buffer &other) const = default;

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer(std::vector<uint8_t>(c, c + s));
    }
  }  // namespace literals

}  // namespace conductor::common

namespace conductor {
  using common::Buffer;
}  // namespace conductor

template <>
struct fmt::formatter<conductor::common::Buffer>
    : fmt::formatter<conductor::common::BufferView> {};
