// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <CLI/CLI11.hpp>
#include <filesystem>

namespace commands {

extern CLI::App_p root_cmd;
extern CLI::App_p init_cmd;
extern CLI::App_p start_cmd;
extern CLI::App_p version_cmd;

/// \brief directory holding one subdirectory per validator
std::filesystem::path home_dir();

void add_command(CLI::App& root, CLI::App_p cmd);

template<typename T, typename... Ts>
void add_command(CLI::App& root, T cmd, Ts... cmds) {
  add_command(root, cmd);
  add_command(root, cmds...);
}

} // namespace commands
