/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <openssl/evp.h>

#include "common/blob.hpp"

namespace conductor::crypto {
  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(common::BufferView input);

  /**
   * Incremental SHA-256 over several byte ranges.
   */
  class Sha256 {
   public:
    Sha256();
    Sha256(const Sha256 &) = delete;
    Sha256 &operator=(const Sha256 &) = delete;
    ~Sha256();

    Sha256 &update(common::BufferView data);

    common::Hash256 finalize();

   private:
    EVP_MD_CTX *ctx_;
  };
}  // namespace conductor::crypto
