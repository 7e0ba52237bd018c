// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/canonical.h>
#include <hybrid/consensus/consensus_state.h>
#include <hybrid/consensus/local_bus.h>
#include <boost/asio/io_context.hpp>
#include <algorithm>
#include <fmt/core.h>
#include <deque>
#include <functional>
#include <map>

namespace hybrid::consensus::test {

constexpr int64_t test_min_power = 10;
constexpr auto test_chain_id = "test_chain";

struct committed_block {
  int64_t height;
  Bytes block_id;
  block block_;
};

/// application recording every commit; commits can be made to fail on demand
class test_application : public application {
public:
  std::vector<Bytes> create_txs(int64_t height, int64_t max_bytes) override {
    return {to_bytes(fmt::format("tx-{}-{}", height, create_count++))};
  }

  Result<void> validate_block(const block& b) override {
    if (block_validator)
      return block_validator(b);
    return success();
  }

  Result<std::vector<validator_update>> on_commit(int64_t height, const Bytes& block_id, const block& b) override {
    if (fail_commits > 0) {
      --fail_commits;
      return Error::format("commit rejected at height {}", height);
    }
    commits.push_back({height, block_id, b});
    if (auto it = updates.find(height); it != updates.end())
      return it->second;
    return std::vector<validator_update>{};
  }

  int fail_commits{0};
  int create_count{0};
  std::function<Result<void>(const block&)> block_validator;
  std::map<int64_t, std::vector<validator_update>> updates;
  std::vector<committed_block> commits;
};

inline consensus_config test_config() {
  auto cfg = consensus_config::get_default();
  return cfg;
}

inline std::vector<priv_key> rand_priv_keys(int num_validators) {
  std::vector<priv_key> keys;
  for (auto i = 0; i < num_validators; i++)
    keys.push_back(priv_key::new_priv_key());
  return keys;
}

inline genesis_doc rand_genesis_doc(const std::vector<priv_key>& keys, int64_t power = test_min_power) {
  genesis_doc doc{get_time(), test_chain_id, 1, {}};
  for (size_t i = 0; i < keys.size(); i++) {
    auto pk = keys[i].get_pub_key();
    doc.validators.push_back(genesis_validator{pk.address(), pk, power, fmt::format("val{}", i)});
  }
  return doc;
}

inline state rand_genesis_state(const std::vector<priv_key>& keys, int64_t power = test_min_power) {
  auto gen = rand_genesis_doc(keys, power);
  auto s = state::make_genesis_state(gen);
  if (!s)
    throw std::runtime_error(s.error().message());
  return s.value();
}

/// moves the key of the proposer for (height, round) to the front
inline std::vector<priv_key> proposer_first(std::vector<priv_key> keys, int64_t height, int32_t round) {
  auto s = rand_genesis_state(keys);
  auto proposer = s.validators->get_proposer(height, round).address;
  auto it = std::find_if(
    keys.begin(), keys.end(), [&](const priv_key& k) { return k.get_pub_key().address() == proposer; });
  std::iter_swap(keys.begin(), it);
  return keys;
}

/// signs a vote with \p key the way a remote validator would
inline vote sign_test_vote(const priv_key& key, signed_msg_type type, int64_t height, int32_t round,
  const Bytes& block_id, const std::string& chain_id = test_chain_id) {
  vote v{type, height, round, block_id, get_time(), key.get_pub_key().address(), {}};
  v.signature = key.sign(canonical::vote_sign_bytes(chain_id, v)).value();
  return v;
}

inline proposal sign_test_proposal(const priv_key& key, int64_t height, int32_t round, int32_t pol_round,
  std::shared_ptr<const block> b, const std::string& chain_id = test_chain_id) {
  auto p = proposal::new_proposal(height, round, pol_round, std::move(b), key.get_pub_key().address());
  p.signature = key.sign(canonical::proposal_sign_bytes(chain_id, p)).value();
  return p;
}

struct test_node {
  priv_key key;
  Bytes address;
  std::shared_ptr<ed25519_signer> signer_;
  std::shared_ptr<test_application> app;
  std::shared_ptr<manual_timeout_ticker> ticker;
  std::shared_ptr<consensus_state> cs;
};

/**
 * Runs a set of validators in one thread over a local_bus.
 * Handlers are drained with io_context::poll and timers are driven by a shared manual clock,
 * so every run is deterministic.
 */
struct test_network {
  explicit test_network(int num_validators, consensus_config cfg = test_config())
    : test_network(rand_priv_keys(num_validators), cfg) {}

  test_network(
    std::vector<priv_key> keys, consensus_config cfg, int num_running = -1, int64_t power = test_min_power)
    : keys(std::move(keys)) {
    genesis = rand_genesis_state(this->keys, power);
    if (num_running < 0)
      num_running = static_cast<int>(this->keys.size());
    for (auto i = 0; i < num_running; i++)
      add_node(this->keys[i], cfg);
  }

  test_node& add_node(const priv_key& key, const consensus_config& cfg) {
    test_node node;
    node.key = key;
    node.address = key.get_pub_key().address();
    node.signer_ = std::make_shared<ed25519_signer>(key);
    node.app = std::make_shared<test_application>();
    node.ticker = std::make_shared<manual_timeout_ticker>(clock);
    node.cs = consensus_state::new_state(
      cfg, genesis, ioc.get_executor(), node.signer_, node.app, bus->endpoint(node.address), node.ticker);
    bus->attach(node.address, node.cs);
    nodes.push_back(std::move(node));
    return nodes.back();
  }

  test_node& node_by_address(const Bytes& address) {
    for (auto& node : nodes) {
      if (node.address == address)
        return node;
    }
    throw std::runtime_error("unknown node");
  }

  void start() {
    for (auto& node : nodes)
      node.cs->on_start();
    run();
  }

  /// \brief runs every ready handler
  void run() {
    ioc.restart();
    ioc.poll();
  }

  /// \brief fires the earliest pending timeout among all nodes
  bool fire_next() {
    test_node* next{};
    std::chrono::system_clock::duration deadline{};
    for (auto& node : nodes) {
      auto d = node.ticker->deadline();
      if (d && (!next || *d < deadline)) {
        next = &node;
        deadline = *d;
      }
    }
    if (!next)
      return false;
    next->ticker->fire_next();
    run();
    return true;
  }

  /// \brief fires timeouts until \p pred holds
  bool run_until(const std::function<bool()>& pred, int max_timeouts = 200) {
    run();
    while (!pred()) {
      if (max_timeouts-- <= 0 || !fire_next())
        return false;
    }
    return true;
  }

  bool all_reached(int64_t height) {
    for (auto& node : nodes) {
      if (node.cs->get_last_height() < height)
        return false;
    }
    return true;
  }

  std::vector<priv_key> keys;
  state genesis;
  boost::asio::io_context ioc;
  std::shared_ptr<manual_clock> clock = std::make_shared<manual_clock>();
  std::shared_ptr<local_bus> bus = std::make_shared<local_bus>();
  std::deque<test_node> nodes;
};

} // namespace hybrid::consensus::test
