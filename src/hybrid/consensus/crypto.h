// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/common/bytes.h>
#include <hybrid/core/result.h>
#include <string>

namespace hybrid::consensus {

constexpr size_t address_size{20};

/// \brief ed25519 public key
struct pub_key {
  Bytes key;

  bool empty() const {
    return key.empty();
  }

  /// \brief derives validator address (first 20 bytes of sha256 of the key)
  Bytes address() const;

  bool verify_signature(BytesView msg, BytesView sig) const;

  std::string get_type() const;

  friend bool operator==(const pub_key& a, const pub_key& b) {
    return a.key == b.key;
  }
};

/// \brief ed25519 private key in libsodium layout (seed followed by public key)
struct priv_key {
  Bytes key;

  static priv_key new_priv_key();

  Result<Bytes> sign(BytesView msg) const;

  pub_key get_pub_key() const;

  std::string get_type() const;

  friend bool operator==(const priv_key& a, const priv_key& b) {
    return a.key == b.key;
  }
};

} // namespace hybrid::consensus
