// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/hex.h>
#include <hybrid/common/time.h>
#include <hybrid/consensus/signer.h>
#include <hybrid/log/log.h>
#include <hybrid/node/node.h>
#include <fmt/core.h>
#include <algorithm>

namespace hybrid::node {

namespace fs = std::filesystem;
using namespace consensus;

Result<std::vector<fs::path>> init_files(
  const fs::path& home, int num_validators, const std::string& chain_id, int64_t power) {
  if (num_validators < 1) {
    return Error::format("number of validators must be positive, got {}", num_validators);
  }
  if (auto existing = load_configs(home); existing && !existing.value().empty()) {
    return Error::format("{} already holds {} validators", home.string(), existing.value().size());
  }

  auto cfg = config::get_default();
  std::vector<fs::path> dirs;
  std::vector<priv_validator_key> keys;
  genesis_doc gen_doc{get_time(), chain_id, 1, {}};
  for (auto i = 0; i < num_validators; i++) {
    dirs.push_back(home / fmt::format("{}{}", validator_dir_prefix, i));
    keys.push_back(priv_validator_key::gen_priv_key());
    gen_doc.validators.push_back(
      genesis_validator{keys.back().address, keys.back().pub_key_, power, fmt::format("validator{}", i)});
  }
  if (auto ok = gen_doc.validate_and_complete(); !ok) {
    return ok.error();
  }

  for (auto i = 0; i < num_validators; i++) {
    cfg.set_root(dirs[i].string());
    if (auto ok = keys[i].save(cfg.priv_validator.key_file()); !ok) {
      return ok.error();
    }
    if (auto ok = gen_doc.save(cfg.base.genesis_file()); !ok) {
      return ok.error();
    }
    ilog("initialized validator: dir={} address={}", dirs[i].string(), to_hex(keys[i].address));
  }
  return dirs;
}

Result<std::vector<config>> load_configs(const fs::path& home) {
  std::vector<config> configs;
  std::error_code ec;
  if (!fs::is_directory(home, ec)) {
    return configs;
  }
  std::vector<fs::path> dirs;
  for (const auto& entry : fs::directory_iterator(home, ec)) {
    if (entry.is_directory() && entry.path().filename().string().starts_with(validator_dir_prefix))
      dirs.push_back(entry.path());
  }
  if (ec) {
    return Error::format("unable to list {}: {}", home.string(), ec.message());
  }
  std::sort(dirs.begin(), dirs.end());
  for (const auto& dir : dirs) {
    auto cfg = config::get_default();
    cfg.set_root(dir.string());
    cfg.base.moniker = dir.filename().string();
    configs.push_back(std::move(cfg));
  }
  return configs;
}

Result<state> load_state_from_store_or_genesis(const state_store& store, const genesis_doc& gen_doc) {
  auto saved = store.load();
  if (!saved) {
    return saved.error();
  }
  if (!saved.value()) {
    return state::make_genesis_state(gen_doc);
  }
  auto& s = *saved.value();
  if (s.chain_id != gen_doc.chain_id) {
    return Error::format("state of chain {} does not match genesis chain {}", s.chain_id, gen_doc.chain_id);
  }
  return std::move(s);
}

local_node::local_node(size_t num_threads)
  : pool("consensus", num_threads, [this](const std::exception& e) { on_fatal(e); }),
    bus_(std::make_shared<local_bus>()) {}

local_node::~local_node() {
  on_stop();
}

Result<void> local_node::add_validator(const config& cfg, size_t txs_per_block) {
  auto gen_doc = genesis_doc::genesis_doc_from_file(cfg.base.genesis_file());
  if (!gen_doc) {
    return gen_doc.error();
  }
  auto key = priv_validator_key::load(cfg.priv_validator.key_file());
  if (!key) {
    return key.error();
  }

  auto signer_ = file_signer::load(key.value().priv_key_, cfg.priv_validator.state_file());
  if (!signer_) {
    return Error::format("{}: {}", cfg.base.root_dir, signer_.error().message());
  }

  auto v = std::make_unique<validator_node>();
  v->config_ = cfg;
  v->address = key.value().address;
  v->store = std::make_shared<state_store>(cfg.base.state_path());
  auto state_ = load_state_from_store_or_genesis(*v->store, gen_doc.value());
  if (!state_) {
    return Error::format("{}: {}", cfg.base.root_dir, state_.error().message());
  }
  if (!validators_.empty() && validators_.front()->cs->get_state().chain_id != state_.value().chain_id) {
    return Error::format("{}: validator belongs to another chain", cfg.base.root_dir);
  }

  v->app = std::make_shared<tx_queue_application>(txs_per_block);
  v->ticker = std::make_shared<asio_timeout_ticker>(pool.get_executor().get_executor());
  v->cs = consensus_state::new_state(cfg.consensus, state_.value(), pool.get_executor().get_executor(),
    signer_.value(), v->app, bus_->endpoint(v->address), v->ticker, v->store);

  auto address = v->address;
  v->app->set_commit_handler([this, address, ticker = v->ticker, halt = halt_height](const committed_block& b) {
    if (halt > 0 && b.height >= halt) {
      ilog("halting validator: address={} height={}", to_hex(address), b.height);
      ticker->stop();
    }
    {
      std::scoped_lock g(mtx);
      heights[address] = b.height;
    }
    cv.notify_all();
  });
  v->cs->set_error_reporter([this, address](const Error& err) {
    wlog("validator reported an error: address={} err={}", to_hex(address), err.message());
    std::scoped_lock g(mtx);
    ++errors;
  });

  ilog("loaded validator: moniker={} address={} height={} in_validator_set={}", cfg.base.moniker, to_hex(address),
    state_.value().last_block_height, state_.value().validators->has_address(address));

  {
    std::scoped_lock g(mtx);
    heights[address] = state_.value().last_block_height;
  }
  bus_->attach(address, v->cs);
  validators_.push_back(std::move(v));
  return success();
}

void local_node::on_start() {
  ilog("starting node: validators={}", validators_.size());
  for (auto& v : validators_) {
    if (halt_height > 0 && v->cs->get_last_height() >= halt_height) {
      ilog("validator already reached halt height: address={}", to_hex(v->address));
      v->ticker->stop();
      continue;
    }
    v->cs->on_start();
  }
}

void local_node::on_stop() {
  {
    std::scoped_lock g(mtx);
    if (stopped)
      return;
    stopped = true;
  }
  for (auto& v : validators_) {
    v->cs->on_stop();
    bus_->detach(v->address);
  }
  pool.stop();
  ilog("node stopped: height={}", min_height());
}

Result<void> local_node::submit_tx(const Bytes& tx) {
  for (auto& v : validators_) {
    if (auto ok = v->app->submit(tx); !ok) {
      return ok.error();
    }
  }
  return success();
}

Result<void> local_node::wait_for_height(int64_t height, std::chrono::steady_clock::duration timeout) {
  std::unique_lock g(mtx);
  auto reached = cv.wait_for(g, timeout, [&]() { return fatal || min_height_locked() >= height; });
  if (fatal) {
    return Error::format("node failed: {}", *fatal);
  }
  if (!reached) {
    return Error::format("timed out waiting for height {}: current={}", height, min_height_locked());
  }
  return success();
}

int64_t local_node::min_height() const {
  std::scoped_lock g(mtx);
  return min_height_locked();
}

int64_t local_node::min_height_locked() const {
  if (heights.empty())
    return 0;
  return std::min_element(heights.begin(), heights.end(), [](const auto& a, const auto& b) {
    return a.second < b.second;
  })->second;
}

size_t local_node::reported_errors() const {
  std::scoped_lock g(mtx);
  return errors;
}

void local_node::on_fatal(const std::exception& e) {
  elog("fatal error: {}", e.what());
  {
    std::scoped_lock g(mtx);
    if (!fatal)
      fatal = e.what();
  }
  cv.notify_all();
}

} // namespace hybrid::node
