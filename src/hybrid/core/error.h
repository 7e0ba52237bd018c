// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <fmt/core.h>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace hybrid {

/// \brief error carried by Result: a message, or an error code from the system
///
/// A default constructed Error means no error.
/// \ingroup core
class Error {
public:
  Error() noexcept = default;

  Error(std::string_view message): message_(message) {}

  Error(std::error_code ec): code_(ec) {}

  template<typename... T>
  static auto format(fmt::format_string<T...> format_str, T&&... args) {
    return Error(fmt::format(format_str, std::forward<T>(args)...));
  }

  const std::error_code& code() const noexcept {
    return code_;
  }

  std::string message() const {
    return message_ ? *message_ : code_.message();
  }

  explicit operator bool() const noexcept {
    return message_.has_value() || static_cast<bool>(code_);
  }

  bool operator==(const Error& err) const noexcept = default;

private:
  std::error_code code_{};
  std::optional<std::string> message_{};
};

} // namespace hybrid
