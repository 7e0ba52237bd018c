// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/check.h>
#include <hybrid/crypto/sha256.h>

namespace hybrid::crypto {

Sha256::Sha256(): ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
  check(ctx != nullptr, "failed to allocate digest context");
  reset();
}

void Sha256::reset() {
  check(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "failed to initialize sha256");
}

auto Sha256::update(BytesView in) -> Sha256& {
  check(EVP_DigestUpdate(ctx.get(), in.data(), in.size()) == 1, "failed to update sha256");
  return *this;
}

auto Sha256::update(std::string_view in) -> Sha256& {
  return update(BytesView{reinterpret_cast<const unsigned char*>(in.data()), in.size()});
}

auto Sha256::final() -> Bytes {
  Bytes out(digest_size);
  check(EVP_DigestFinal_ex(ctx.get(), out.data(), nullptr) == 1, "failed to finalize sha256");
  reset();
  return out;
}

} // namespace hybrid::crypto
