/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <stdexcept>

namespace conductor::crypto {
  common::Hash256 sha256(std::string_view input) {
    return sha256(common::str2byte(input));
  }

  common::Hash256 sha256(common::BufferView input) {
    return Sha256{}.update(input).finalize();
  }

  Sha256::Sha256() : ctx_{EVP_MD_CTX_new()} {
    if (ctx_ == nullptr
        or EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
      EVP_MD_CTX_free(ctx_);
      throw std::runtime_error("SHA-256 context initialization failed");
    }
  }

  Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
  }

  Sha256 &Sha256::update(common::BufferView data) {
    EVP_DigestUpdate(ctx_, data.data(), data.size());
    return *this;
  }

  common::Hash256 Sha256::finalize() {
    common::Hash256 out;
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, out.data(), &len);
    return out;
  }
}  // namespace conductor::crypto
