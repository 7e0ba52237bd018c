// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/application.h>
#include <hybrid/consensus/config.h>
#include <hybrid/consensus/round_state.h>
#include <hybrid/consensus/signer.h>
#include <hybrid/consensus/state.h>
#include <hybrid/consensus/state_store.h>
#include <hybrid/consensus/timeout_ticker.h>
#include <hybrid/consensus/transport.h>
#include <hybrid/consensus/vote_store.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace hybrid::consensus {

/// decided block of a past height and the precommits deciding it
struct commit_record {
  std::shared_ptr<const proposal> proposal_msg;
  std::vector<vote> precommits;
};

/**
 * Handles execution of the consensus algorithm.
 * It processes votes and proposals, and upon reaching agreement,
 * commits blocks to the chain and hands them to the application.
 * The internal state machine receives input from peers, the internal validator, and from a timer.
 * All inputs are serialized through a strand, so state transitions never run concurrently.
 */
struct consensus_state : public std::enable_shared_from_this<consensus_state> {
  using error_reporter = std::function<void(const Error&)>;

  static std::shared_ptr<consensus_state> new_state(const consensus_config& cs_config_, const state& state_,
    boost::asio::any_io_executor ex, std::shared_ptr<signer> priv_validator, std::shared_ptr<application> app_,
    std::shared_ptr<transport> bus, std::shared_ptr<timeout_ticker> ticker_,
    std::shared_ptr<state_store> store_ = nullptr);

  state get_state();
  int64_t get_last_height();
  round_state get_round_state();

  /// \brief receives commit failures and persistence faults
  void set_error_reporter(error_reporter reporter);

  /// \brief starts round 0 of the current height
  void on_start();
  void on_stop();

  /// \brief queues an inbound message for the state machine
  void send(msg_info_ptr mi);
  void receive_proposal(const proposal& p, std::string peer_id = {});
  void receive_vote(const vote& v, std::string peer_id = {});

  void update_round_step(int32_t round, round_step_type step);
  void schedule_round_0(round_state& rs_);
  void update_to_state(const state& state_);

  void receive_routine(msg_info_ptr mi);

  void schedule_timeout(
    std::chrono::system_clock::duration duration_, int64_t height, int32_t round, round_step_type step);
  void tock(timeout_info_ptr ti);
  void handle_timeout(timeout_info_ptr ti);

  void enter_new_round(int64_t height, int32_t round);

  void enter_propose(int64_t height, int32_t round);
  bool is_proposal_complete();
  bool is_proposer(const Bytes& address);
  void decide_proposal(int64_t height, int32_t round);

  void enter_prevote(int64_t height, int32_t round);
  void do_prevote(int64_t height, int32_t round);

  void enter_precommit(int64_t height, int32_t round);
  void enter_commit(int64_t height, int32_t round);

  void try_finalize_commit(int64_t height);
  void finalize_commit(int64_t height);
  bool apply_decided_block(int64_t height, const Bytes& block_id, std::shared_ptr<const block> block_);
  void retry_commit(int64_t height, std::shared_ptr<const block> block_);
  void replay_decided_block();

  void record_commit(int64_t height, const Bytes& block_id, std::shared_ptr<const block> block_);
  void send_commit(int64_t height, const std::string& peer_id);
  void request_commit(int64_t height);
  void catch_up(int64_t height, int32_t round);
  void set_proposal(const proposal& msg);
  bool add_vote(const vote& vote_, const std::string& peer_id);
  std::optional<vote> sign_vote(signed_msg_type msg_type, const Bytes& hash);
  tstamp vote_time();
  std::optional<vote> sign_add_vote(signed_msg_type msg_type, const Bytes& hash);
  void report_error(const Error& err);

  consensus_config cs_config;

  std::shared_ptr<signer> signer_;
  std::shared_ptr<application> app;
  std::shared_ptr<transport> transport_;
  std::shared_ptr<timeout_ticker> ticker;
  std::shared_ptr<state_store> store;

  // internal state
  std::mutex mtx;
  round_state rs{};
  state local_state; // State until height-1.
  std::unique_ptr<vote_store> votes;
  std::optional<decided_block> pending_decided; // saved before a crash, applied on start

  // catching up with peers at later heights
  std::deque<commit_record> commit_history;
  std::pair<int64_t, int32_t> catchup_mark{};
  int64_t max_peer_height{0};

  boost::asio::strand<boost::asio::any_io_executor> strand;
  error_reporter reporter;

  explicit consensus_state(boost::asio::any_io_executor ex): strand(boost::asio::make_strand(std::move(ex))) {}
};

} // namespace hybrid::consensus
