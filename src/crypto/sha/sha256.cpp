/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace dataworker::crypto {
  namespace {
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    // Digest of all `chunks` fed sequentially
    template <typename... Chunks>
    Hash256 digest(const Chunks &...chunks) {
      EvpMdCtxPtr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
      if (ctx == nullptr
          or EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256: can't initialize digest context");
      }
      auto update = [&](qtils::ByteView chunk) {
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), chunk.size()) != 1) {
          throw std::runtime_error("sha256: digest update failed");
        }
      };
      (update(chunks), ...);
      Hash256 out;
      unsigned int size = 0;
      if (EVP_DigestFinal_ex(ctx.get(), out.data(), &size) != 1
          or size != out.size()) {
        throw std::runtime_error("sha256: digest finalization failed");
      }
      return out;
    }
  }  // namespace

  Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  Hash256 sha256(qtils::ByteView input) {
    return digest(input);
  }

  Hash256 sha256(const Hash256 &left, const Hash256 &right) {
    return digest(qtils::ByteView{left}, qtils::ByteView{right});
  }
}  // namespace dataworker::crypto
