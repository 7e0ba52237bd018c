// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/common/time.h>
#include <chrono>
#include <filesystem>
#include <string>

namespace hybrid::consensus {

struct base_config {
  std::string chain_id;
  std::string root_dir;
  std::string moniker;
  std::string log_level;
  std::string genesis;
  std::string state_file;

  static base_config get_default() {
    base_config cfg;
    cfg.genesis = "config/genesis.json";
    cfg.state_file = "data/state.json";
    cfg.log_level = "info";
    return cfg;
  }

  std::filesystem::path genesis_file() const {
    return std::filesystem::path(root_dir) / genesis;
  }

  std::filesystem::path state_path() const {
    return std::filesystem::path(root_dir) / state_file;
  }
};

struct consensus_config {
  std::chrono::system_clock::duration timeout_propose;
  std::chrono::system_clock::duration timeout_propose_delta;
  std::chrono::system_clock::duration timeout_prevote;
  std::chrono::system_clock::duration timeout_prevote_delta;
  std::chrono::system_clock::duration timeout_precommit;
  std::chrono::system_clock::duration timeout_precommit_delta;
  std::chrono::system_clock::duration timeout_commit;

  bool skip_timeout_commit;

  int64_t max_block_bytes;

  /// votes for rounds further ahead than this are dropped
  int32_t max_future_rounds;

  /// decided heights kept to answer commit requests of lagging peers
  size_t commit_history;

  static consensus_config get_default() {
    consensus_config cfg;
    cfg.timeout_propose = std::chrono::milliseconds{3000};
    cfg.timeout_propose_delta = std::chrono::milliseconds{500};
    cfg.timeout_prevote = std::chrono::milliseconds{1000};
    cfg.timeout_prevote_delta = std::chrono::milliseconds{500};
    cfg.timeout_precommit = std::chrono::milliseconds{1000};
    cfg.timeout_precommit_delta = std::chrono::milliseconds{500};
    cfg.timeout_commit = std::chrono::milliseconds{1000};
    cfg.skip_timeout_commit = false;
    cfg.max_block_bytes = 1024 * 1024;
    cfg.max_future_rounds = 100;
    cfg.commit_history = 64;
    return cfg;
  }

  std::chrono::system_clock::duration propose(int32_t round) const {
    return timeout_propose + (timeout_propose_delta * round);
  }

  std::chrono::system_clock::duration prevote(int32_t round) const {
    return timeout_prevote + (timeout_prevote_delta * round);
  }

  std::chrono::system_clock::duration precommit(int32_t round) const {
    return timeout_precommit + (timeout_precommit_delta * round);
  }

  /**
   * returns the amount of time to wait for straggler votes after receiving 2/3+ precommits
   */
  tstamp commit(tstamp t) const {
    return t + std::chrono::duration_cast<std::chrono::microseconds>(timeout_commit).count();
  }
};

struct priv_validator_config {
  std::string root_dir;
  /// Path to the JSON file containing the private key to use as a validator in the consensus protocol
  std::string key;
  /// Path to the JSON file containing the last sign state of a validator
  std::string state;

  static priv_validator_config get_default() {
    return {.key = "config/priv_validator_key.json", .state = "data/priv_validator_state.json"};
  }

  std::filesystem::path key_file() const {
    return std::filesystem::path(root_dir) / key;
  }

  std::filesystem::path state_file() const {
    return std::filesystem::path(root_dir) / state;
  }
};

struct config {
  base_config base;
  consensus_config consensus;
  priv_validator_config priv_validator;

  static config get_default() {
    return {base_config::get_default(), consensus_config::get_default(), priv_validator_config::get_default()};
  }

  void set_root(const std::string& root) {
    base.root_dir = root;
    priv_validator.root_dir = root;
  }
};

} // namespace hybrid::consensus
