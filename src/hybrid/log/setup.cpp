// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/log/setup.h>
#include <hybrid/thread/thread_name.h>
#include <spdlog/details/fmt_helper.h>
#include <spdlog/pattern_formatter.h>

namespace hybrid::log {

namespace fmt_helper = spdlog::details::fmt_helper;

namespace {

const std::string spaces(64, ' ');

class thread_name_formatter : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg&, const std::tm&, spdlog::memory_buf_t& dest) override {
    auto name = std::string_view{thread::thread_name()};
    fmt_helper::append_string_view(name, dest);
    if (padinfo_.enabled() && name.size() < padinfo_.width_) {
      fmt_helper::append_string_view(std::string_view(spaces).substr(0, padinfo_.width_ - name.size()), dest);
    }
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<thread_name_formatter>();
  }
};

class source_location_formatter : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
    if (msg.source.empty()) {
      if (padinfo_.enabled()) {
        fmt_helper::append_string_view(std::string_view(spaces).substr(0, padinfo_.width_), dest);
      }
      return;
    }
    auto filename = std::string_view(msg.source.filename);
    auto pos = filename.find_last_of('/');
    auto basename = filename.substr(pos == std::string_view::npos ? 0 : pos + 1);
    fmt_helper::append_string_view(basename, dest);
    dest.push_back(':');
    fmt_helper::append_int(msg.source.line, dest);
    if (padinfo_.enabled()) {
      auto size = basename.size() + 1 + fmt_helper::count_digits(msg.source.line);
      if (size < padinfo_.width_) {
        fmt_helper::append_string_view(std::string_view(spaces).substr(0, padinfo_.width_ - size), dest);
      }
    }
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<source_location_formatter>();
  }
};

} // namespace

void set_level(const std::string& level) {
  spdlog::set_level(spdlog::level::from_str(level));
}

void setup() {
  static const char* pattern = "%^%-5l%$ %Y-%m-%dT%T.%e %-12t %-28@] %v";
  auto formatter = std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::utc);
  formatter->add_flag<source_location_formatter>('@');
  formatter->add_flag<thread_name_formatter>('t');
  spdlog::set_formatter(std::move(formatter));
}

} // namespace hybrid::log
