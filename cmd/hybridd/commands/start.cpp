// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <commands/commands.h>
#include <hybrid/common/bytes.h>
#include <hybrid/log/log.h>
#include <hybrid/node/node.h>
#include <fmt/core.h>
#include <algorithm>
#include <thread>

namespace commands {

namespace {

int64_t blocks = 10;
size_t txs_per_block = 100;
int num_txs = 1000;
size_t num_threads = std::max(2u, std::thread::hardware_concurrency());
int timeout_secs = 600;

void run() {
  auto configs = hybrid::node::load_configs(home_dir());
  if (!configs) {
    elog("{}", configs.error().message());
    throw CLI::RuntimeError(1);
  }
  if (configs.value().empty()) {
    elog("no validators under {}; run init first", home_dir().string());
    throw CLI::RuntimeError(1);
  }

  hybrid::node::local_node node(num_threads);
  for (const auto& cfg : configs.value()) {
    if (auto ok = node.add_validator(cfg, txs_per_block); !ok) {
      elog("failed to load validator: {}", ok.error().message());
      throw CLI::RuntimeError(1);
    }
  }
  auto target = node.min_height() + blocks;
  node.set_halt_height(target);

  for (auto i = 0; i < num_txs; i++) {
    if (auto ok = node.submit_tx(hybrid::to_bytes(fmt::format("tx-{}-{}", target, i))); !ok) {
      elog("failed to submit transaction: {}", ok.error().message());
      throw CLI::RuntimeError(1);
    }
  }

  ilog("running validators: count={} target_height={}", node.validators().size(), target);
  node.on_start();
  auto done = node.wait_for_height(target, std::chrono::seconds(timeout_secs));
  node.on_stop();
  if (!done) {
    elog("{}", done.error().message());
    throw CLI::RuntimeError(1);
  }
  ilog("all validators committed height {}: reported_errors={}", target, node.reported_errors());
}

} // namespace

CLI::App_p start_cmd = []() {
  auto cmd = std::make_shared<CLI::App>("Run every validator under the home directory", "start");
  cmd->alias("node")->alias("run");
  cmd->add_option("--blocks", blocks, "number of blocks to commit before halting")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  cmd->add_option("--txs", num_txs, "number of transactions submitted to every validator")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  cmd->add_option("--txs-per-block", txs_per_block, "maximum transactions in a block")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  cmd->add_option("--threads", num_threads, "consensus worker threads")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  cmd->add_option("--timeout", timeout_secs, "seconds to wait for the target height")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  cmd->final_callback(run);
  return cmd;
}();

} // namespace commands
