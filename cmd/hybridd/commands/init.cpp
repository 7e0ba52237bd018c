// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <commands/commands.h>
#include <hybrid/log/log.h>
#include <hybrid/node/node.h>

namespace commands {

namespace {

int num_validators = 4;
std::string chain_id = "hybrid-local";
int64_t power = 10;

} // namespace

CLI::App_p init_cmd = []() {
  auto cmd = std::make_shared<CLI::App>("Generate validator keys and a shared genesis", "init");
  cmd->add_option("--validators,-n", num_validators, "number of validators")
    ->check(CLI::Range(1, 100))
    ->capture_default_str();
  cmd->add_option("--chain-id", chain_id, "chain identifier written to genesis")->capture_default_str();
  cmd->add_option("--power", power, "voting power of each validator")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  cmd->final_callback([]() {
    auto dirs = hybrid::node::init_files(home_dir(), num_validators, chain_id, power);
    if (!dirs) {
      elog("failed to initialize validators: {}", dirs.error().message());
      throw CLI::RuntimeError(1);
    }
    ilog("initialized {} validators under {}", dirs.value().size(), home_dir().string());
  });
  return cmd;
}();

} // namespace commands
