// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hybrid {

/// \brief throws \p Error with \p msg unless \p pred holds
///
/// Used for broken invariants and unrecoverable local faults, never for conditions a peer can cause.
/// \ingroup common
template<typename Error = std::runtime_error>
void check(bool pred, std::string_view msg = {}) {
  if (!pred) {
    throw Error(std::string(msg));
  }
}

/// \brief formatting variant of check()
template<typename Error = std::runtime_error, typename T, typename... Ts>
void check(bool pred, fmt::format_string<T, Ts...> format_str, T&& arg, Ts&&... args) {
  if (!pred) {
    throw Error(fmt::format(format_str, std::forward<T>(arg), std::forward<Ts>(args)...));
  }
}

} // namespace hybrid
