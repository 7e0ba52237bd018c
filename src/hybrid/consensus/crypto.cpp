// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/check.h>
#include <hybrid/consensus/crypto.h>
#include <hybrid/crypto/sha256.h>

extern "C" {
#include <sodium.h>
}

namespace hybrid::consensus {

constexpr size_t pub_key_size{32};
constexpr size_t priv_key_size{64};
constexpr size_t signature_size{64};
constexpr std::string_view key_type{"ed25519"};

namespace detail {
  void init_sodium() {
    static const int ret = sodium_init();
    check(ret >= 0, "unable to initialize libsodium");
  }

  Result<Bytes> sign(BytesView msg, const Bytes& key) {
    if (key.size() != priv_key_size) {
      return Error::format("unable to sign: invalid private key size {}", key.size());
    }
    init_sodium();
    Bytes sig(signature_size);
    if (crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), key.data()) == 0)
      return sig;
    return Error::format("unable to sign");
  }

  bool verify(BytesView sig, BytesView msg, const Bytes& key) {
    if (sig.size() != signature_size || key.size() != pub_key_size)
      return false;
    init_sodium();
    return crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), key.data()) == 0;
  }

} // namespace detail

Bytes pub_key::address() const {
  check(key.size() == pub_key_size, "pub_key: unable to derive address as key has incorrect size");
  auto h = crypto::Sha256()(BytesView{key});
  return {h.begin(), h.begin() + address_size};
}

bool pub_key::verify_signature(BytesView msg, BytesView sig) const {
  return detail::verify(sig, msg, key);
}

std::string pub_key::get_type() const {
  return std::string(key_type);
}

priv_key priv_key::new_priv_key() {
  detail::init_sodium();
  Bytes pub_key_(pub_key_size), priv_key_(priv_key_size);
  crypto_sign_keypair(pub_key_.data(), priv_key_.data());
  return {.key = priv_key_};
}

Result<Bytes> priv_key::sign(BytesView msg) const {
  return detail::sign(msg, key);
}

pub_key priv_key::get_pub_key() const {
  check(key.size() == priv_key_size, "priv_key: unable to derive public key as key has incorrect size");
  return {.key = {key.begin() + 32, key.end()}};
}

std::string priv_key::get_type() const {
  return std::string(key_type);
}

} // namespace hybrid::consensus
