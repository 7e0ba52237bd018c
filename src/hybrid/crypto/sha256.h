// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/common/bytes.h>
#include <openssl/evp.h>
#include <memory>
#include <string_view>

/// \brief crypto namespace
/// \ingroup crypto
namespace hybrid::crypto {

/// \brief sha256 over an OpenSSL digest context
///
/// Block ids and validator addresses are derived from it. The context is reset by final(),
/// so one instance can hash several inputs in turn.
class Sha256 {
public:
  static constexpr size_t digest_size = 32;

  Sha256();

  auto update(BytesView in) -> Sha256&;
  auto update(std::string_view in) -> Sha256&;

  /// \brief returns the digest of everything passed to update() since the last final()
  auto final() -> Bytes;

  auto operator()(BytesView in) -> Bytes {
    return update(in).final();
  }

  auto operator()(std::string_view in) -> Bytes {
    return update(in).final();
  }

private:
  void reset();

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
};

} // namespace hybrid::crypto
