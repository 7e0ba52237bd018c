// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/hex.h>
#include <cppcodec/hex_default_lower.hpp>
#include <stdexcept>

namespace hybrid {

std::string to_hex(BytesView s) {
  return hex::encode(s.data(), s.size());
}

Bytes from_hex(std::string_view s) {
  if (s.starts_with("0x") || s.starts_with("0X")) {
    s.remove_prefix(2);
  }
  try {
    return hex::decode<Bytes>(s.data(), s.size());
  } catch (const cppcodec::parse_error& e) {
    throw std::invalid_argument(e.what());
  }
}

} // namespace hybrid
