// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/config.h>
#include <hybrid/consensus/consensus_state.h>
#include <hybrid/consensus/local_bus.h>
#include <hybrid/node/tx_queue_application.h>
#include <hybrid/thread/named_thread_pool.h>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <optional>

namespace hybrid::node {

constexpr auto validator_dir_prefix = "node";

/// \brief generates keys and a shared genesis for \p num_validators validators under \p home
///
/// Each validator gets `<home>/node<i>/config/{genesis.json,priv_validator_key.json}`.
/// Fails if \p home already holds validator directories.
Result<std::vector<std::filesystem::path>> init_files(
  const std::filesystem::path& home, int num_validators, const std::string& chain_id, int64_t power = 10);

/// \brief returns the config of every validator directory under \p home, in directory order
Result<std::vector<consensus::config>> load_configs(const std::filesystem::path& home);

/// \brief loads the persisted state, or creates one from the genesis doc on first start
Result<consensus::state> load_state_from_store_or_genesis(
  const consensus::state_store& store, const consensus::genesis_doc& gen_doc);

struct validator_node {
  consensus::config config_;
  Bytes address;
  std::shared_ptr<consensus::state_store> store;
  std::shared_ptr<tx_queue_application> app;
  std::shared_ptr<consensus::asio_timeout_ticker> ticker;
  std::shared_ptr<consensus::consensus_state> cs;
};

/**
 * Runs validators in one process.
 * Validators talk over a local_bus and share a pool of named threads; each engine serializes its own work on a strand.
 */
class local_node {
public:
  explicit local_node(size_t num_threads = 4);
  ~local_node();

  local_node(const local_node&) = delete;
  local_node& operator=(const local_node&) = delete;

  /// \brief loads a validator from the files under its root directory
  Result<void> add_validator(const consensus::config& cfg, size_t txs_per_block = 100);

  /// \brief validators stop their timers once they commit \p height, so none of them moves past it
  ///
  /// Must be set before validators are added.
  void set_halt_height(int64_t height) {
    halt_height = height;
  }

  void on_start();
  void on_stop();

  /// \brief queues a transaction at every validator
  Result<void> submit_tx(const Bytes& tx);

  /// \brief blocks until every validator has committed \p height
  /// \return error on timeout or after a fatal fault in any validator
  Result<void> wait_for_height(int64_t height, std::chrono::steady_clock::duration timeout);

  /// \brief lowest committed height among the validators
  int64_t min_height() const;

  /// \brief number of errors reported by the engines, such as failed commits
  size_t reported_errors() const;

  const std::vector<std::unique_ptr<validator_node>>& validators() const {
    return validators_;
  }

  const std::shared_ptr<consensus::local_bus>& bus() const {
    return bus_;
  }

private:
  void on_fatal(const std::exception& e);
  int64_t min_height_locked() const;

  thread::named_thread_pool pool;
  std::shared_ptr<consensus::local_bus> bus_;
  std::vector<std::unique_ptr<validator_node>> validators_;

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::map<Bytes, int64_t> heights;
  std::optional<std::string> fatal;
  size_t errors{0};
  bool stopped{false};
  int64_t halt_height{0};
};

} // namespace hybrid::node
