// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <commands/commands.h>
#include <hybrid/log/setup.h>
#include <cstdlib>

namespace commands {

namespace {

std::filesystem::path home;
std::string log_level = "info";

std::filesystem::path default_home() {
  std::filesystem::path dir;
  if (auto arg = std::getenv("HOME")) {
    dir = arg;
  }
  return dir / ".hybrid";
}

} // namespace

CLI::App_p root_cmd = []() {
  auto cmd = std::make_shared<CLI::App>("Tendermint-style BFT consensus for a local validator set", "hybridd");
  cmd->require_subcommand();
  cmd->failure_message(CLI::FailureMessage::help);
  cmd->set_help_all_flag("--help-all")->group("");
  home = default_home();
  cmd->add_option("--home", home, "directory for validator config and data")->capture_default_str();
  cmd->add_option("--log-level", log_level, "log level")
    ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
    ->capture_default_str();
  cmd->preparse_callback([](std::size_t) { hybrid::log::setup(); });
  cmd->parse_complete_callback([]() { hybrid::log::set_level(log_level); });
  return cmd;
}();

std::filesystem::path home_dir() {
  if (home.is_relative())
    return std::filesystem::current_path() / home;
  return home;
}

void add_command(CLI::App& root, CLI::App_p cmd) {
  cmd->fallthrough();
  root.add_subcommand(cmd);
}

} // namespace commands
