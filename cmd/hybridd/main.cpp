// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <commands/commands.h>

namespace cmd = commands;

int main(int argc, char** argv) {
  auto& root_cmd = *cmd::root_cmd;
  cmd::add_command(root_cmd, cmd::init_cmd, cmd::start_cmd, cmd::version_cmd);

  CLI11_PARSE(root_cmd, argc, argv)

  return 0;
}
