// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace hybrid {

/// \brief dynamic sized byte sequence
/// \ingroup common
using Bytes = std::vector<unsigned char>;

using BytesView = std::span<const unsigned char>;
using BytesViewMut = std::span<unsigned char>;

inline Bytes to_bytes(std::string_view s) {
  return {s.begin(), s.end()};
}

inline std::string_view to_string_view(const Bytes& b) {
  return {reinterpret_cast<const char*>(b.data()), b.size()};
}

} // namespace hybrid
