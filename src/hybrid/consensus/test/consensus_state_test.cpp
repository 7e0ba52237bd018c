// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <hybrid/consensus/test/common_test.h>
#include <numeric>

using namespace hybrid;
using namespace hybrid::consensus;
using namespace hybrid::consensus::test;
using namespace std::chrono_literals;

namespace {

/// a single running validator; the other validators are driven by the test
struct single_node_fixture {
  explicit single_node_fixture(int32_t proposer_round = 0)
    : net(proposer_first(rand_priv_keys(4), 1, proposer_round), test_config(), 1, 1), node(net.nodes.front()) {}

  const priv_key& other(int i) {
    return net.keys[i];
  }

  void prevote_from(int i, const Bytes& block_id, int32_t round = 0) {
    node.cs->receive_vote(sign_test_vote(other(i), Prevote, 1, round, block_id), "peer");
    net.run();
  }

  void precommit_from(int i, const Bytes& block_id, int32_t round = 0) {
    node.cs->receive_vote(sign_test_vote(other(i), Precommit, 1, round, block_id), "peer");
    net.run();
  }

  /// a block for height 1 proposed by validator \p i in \p round
  proposal propose_from(int i, int32_t round, int32_t pol_round = -1) {
    auto txs = std::vector<Bytes>{to_bytes(fmt::format("block-{}", round))};
    auto b = std::make_shared<const block>(
      net.genesis.make_block(1, std::move(txs), other(i).get_pub_key().address(), get_time()));
    return sign_test_proposal(other(i), 1, round, pol_round, b);
  }

  /// index of the validator proposing \p round of height 1
  int proposer_of(int32_t round) {
    auto address = net.genesis.validators->get_proposer(1, round).address;
    for (auto i = 0u; i < net.keys.size(); i++) {
      if (net.keys[i].get_pub_key().address() == address)
        return i;
    }
    return -1;
  }

  std::optional<vote> own_vote(signed_msg_type type, int32_t round) {
    for (const auto& v : node.cs->votes->get_votes(1, round, type)) {
      if (v.validator_address == node.address)
        return v;
    }
    return {};
  }

  test_network net;
  test_node& node;
};

} // namespace

TEST_CASE("consensus_state: Proposer selection", "[consensus_state]") {
  single_node_fixture f;
  f.net.start();

  auto rs = f.node.cs->get_round_state();
  CHECK(rs.height == 1);
  CHECK(rs.round == 0);
  CHECK(rs.validators->get_proposer(1, 0).address == f.node.address);
  REQUIRE(rs.proposal_msg);
  CHECK(rs.proposal_msg->proposer_address == f.node.address);
  CHECK(rs.proposal_msg->pol_round == -1);
  REQUIRE(rs.proposal_block);
  CHECK(rs.proposal_block->height == 1);
  CHECK(rs.proposal_block->txs.size() == 1);
  CHECK(rs.step == round_step_type::Prevote);

  auto prevote = f.own_vote(Prevote, 0);
  REQUIRE(prevote);
  CHECK(prevote->block_id == rs.proposal_msg->block_id);
}

TEST_CASE("consensus_state: Commit with 3 of 4 validators", "[consensus_state]") {
  single_node_fixture f;
  f.net.start();

  auto block_id = f.node.cs->get_round_state().proposal_msg->block_id;
  f.prevote_from(1, block_id);
  CHECK(f.node.cs->get_round_state().step == round_step_type::Prevote);

  f.prevote_from(2, block_id);
  auto rs = f.node.cs->get_round_state();
  CHECK(rs.step == round_step_type::Precommit);
  REQUIRE(rs.locked_block);
  CHECK(rs.locked_block->hashes_to(block_id));
  CHECK(rs.locked_round == 0);
  REQUIRE(rs.valid_block);
  CHECK(rs.valid_block->hashes_to(block_id));
  auto precommit = f.own_vote(Precommit, 0);
  REQUIRE(precommit);
  CHECK(precommit->block_id == block_id);

  f.precommit_from(1, block_id);
  CHECK(f.node.app->commits.empty());
  f.precommit_from(2, block_id);

  REQUIRE(f.node.app->commits.size() == 1);
  CHECK(f.node.app->commits[0].height == 1);
  CHECK(f.node.app->commits[0].block_id == block_id);

  rs = f.node.cs->get_round_state();
  CHECK(rs.height == 2);
  CHECK(rs.round == 0);
  CHECK(rs.step == round_step_type::NewHeight);
  CHECK(!rs.locked_block);
  CHECK(!rs.valid_block);
  CHECK(rs.locked_round == -1);

  auto s = f.node.cs->get_state();
  CHECK(s.last_block_height == 1);
  CHECK(s.last_block_id == block_id);
  CHECK(f.node.cs->get_last_height() == 1);

  // late precommit for the committed height is kept but changes nothing
  f.precommit_from(3, block_id);
  CHECK(f.node.cs->votes->power_for_block(1, 0, Precommit, block_id) == 4);
  CHECK(f.node.app->commits.size() == 1);
  CHECK(f.node.cs->get_round_state().height == 2);
}

TEST_CASE("consensus_state: Prevote timeout without quorum", "[consensus_state]") {
  single_node_fixture f;
  f.net.start();

  auto block_id = f.node.cs->get_round_state().proposal_msg->block_id;
  f.prevote_from(1, block_id);
  CHECK(f.node.cs->get_round_state().step == round_step_type::Prevote);

  // prevote timeout
  REQUIRE(f.net.fire_next());
  auto rs = f.node.cs->get_round_state();
  CHECK(rs.step == round_step_type::Precommit);
  CHECK(!rs.locked_block);
  auto precommit = f.own_vote(Precommit, 0);
  REQUIRE(precommit);
  CHECK(precommit->is_nil());

  // precommit timeout
  REQUIRE(f.net.fire_next());
  rs = f.node.cs->get_round_state();
  CHECK(rs.height == 1);
  CHECK(rs.round == 1);
  CHECK(!rs.locked_block);
  CHECK(rs.locked_round == -1);
  CHECK(f.node.app->commits.empty());
}

TEST_CASE("consensus_state: Round advance with zero votes", "[consensus_state]") {
  // run a validator that is not the proposer of round 0
  single_node_fixture f(1);
  f.net.start();

  auto rs = f.node.cs->get_round_state();
  CHECK(rs.step == round_step_type::Propose);
  CHECK(!rs.proposal_msg);

  auto cfg = test_config();
  int32_t last_round = 0;
  for (auto i = 0; i < 12; i++) {
    auto pending = f.node.ticker->pending();
    REQUIRE(pending);
    if (pending->step == round_step_type::Propose)
      CHECK(pending->duration_ == cfg.propose(pending->round));
    REQUIRE(f.net.fire_next());
    rs = f.node.cs->get_round_state();
    CHECK(rs.height == 1);
    CHECK(rs.round >= last_round);
    last_round = rs.round;
  }
  CHECK(last_round >= 3);
  CHECK(f.node.app->commits.empty());
  // timeouts grow with the round
  CHECK(cfg.propose(last_round) > cfg.propose(0));
}

TEST_CASE("consensus_state: Stale timeout is ignored", "[consensus_state]") {
  single_node_fixture f(1);
  f.net.start();

  // propose, prevote and precommit timeouts of round 0
  for (auto i = 0; i < 3; i++)
    REQUIRE(f.net.fire_next());
  auto rs = f.node.cs->get_round_state();
  REQUIRE(rs.round == 1);

  f.node.cs->handle_timeout(std::make_shared<timeout_info>(timeout_info{0ms, 1, 0, round_step_type::Propose}));
  f.node.cs->handle_timeout(std::make_shared<timeout_info>(timeout_info{0ms, 1, 0, round_step_type::Precommit}));
  f.node.cs->handle_timeout(std::make_shared<timeout_info>(timeout_info{0ms, 2, 1, round_step_type::Prevote}));
  f.net.run();

  auto after = f.node.cs->get_round_state();
  CHECK(after.height == rs.height);
  CHECK(after.round == rs.round);
  CHECK(after.step == rs.step);
}

TEST_CASE("consensus_state: Locking", "[consensus_state]") {
  single_node_fixture f;
  f.net.start();

  // lock on our own proposal in round 0
  auto locked_id = f.node.cs->get_round_state().proposal_msg->block_id;
  f.prevote_from(1, locked_id);
  f.prevote_from(2, locked_id);
  auto rs = f.node.cs->get_round_state();
  REQUIRE(rs.locked_block);
  REQUIRE(rs.locked_round == 0);

  // precommits do not reach a quorum
  REQUIRE(f.net.fire_next());
  rs = f.node.cs->get_round_state();
  REQUIRE(rs.round == 1);
  CHECK(rs.locked_block);
  CHECK(rs.locked_block->hashes_to(locked_id));

  // another block proposed in round 1 gets a nil prevote
  auto proposer = f.proposer_of(1);
  REQUIRE(proposer > 0);
  auto other = f.propose_from(proposer, 1);
  f.node.cs->receive_proposal(other, "peer");
  f.net.run();
  rs = f.node.cs->get_round_state();
  REQUIRE(rs.proposal_msg);
  CHECK(rs.proposal_msg->block_id == other.block_id);
  auto prevote = f.own_vote(Prevote, 1);
  REQUIRE(prevote);
  CHECK(prevote->is_nil());
  CHECK(rs.locked_block->hashes_to(locked_id));

  SECTION("nil polka keeps the lock") {
    for (auto i = 1; i < 3; i++)
      f.prevote_from(i, {}, 1);
    rs = f.node.cs->get_round_state();
    CHECK(rs.step == round_step_type::Precommit);
    CHECK(rs.locked_block->hashes_to(locked_id));
    CHECK(rs.locked_round == 0);
    REQUIRE(f.own_vote(Precommit, 1));
    CHECK(f.own_vote(Precommit, 1)->is_nil());
  }

  SECTION("polka for another block in a later round moves the lock") {
    for (auto i = 1; i < 4; i++)
      f.prevote_from(i, other.block_id, 1);
    rs = f.node.cs->get_round_state();
    CHECK(rs.step == round_step_type::Precommit);
    REQUIRE(rs.locked_block);
    CHECK(rs.locked_block->hashes_to(other.block_id));
    CHECK(rs.locked_round == 1);
    REQUIRE(f.own_vote(Precommit, 1));
    CHECK(f.own_vote(Precommit, 1)->block_id == other.block_id);
  }
}

TEST_CASE("consensus_state: Re-proposes the valid block", "[consensus_state]") {
  // our node proposes round 1; round 0 belongs to another validator
  single_node_fixture f(1);
  f.net.start();
  auto proposer = f.proposer_of(0);
  REQUIRE(proposer > 0);

  auto p = f.propose_from(proposer, 0);
  f.node.cs->receive_proposal(p, "peer");
  f.net.run();
  for (auto i = 1; i < 3; i++)
    f.prevote_from(i, p.block_id);
  auto rs = f.node.cs->get_round_state();
  REQUIRE(rs.valid_block);
  CHECK(rs.valid_round == 0);

  // precommit timeout moves to round 1 where we propose the valid block
  REQUIRE(f.net.fire_next());
  rs = f.node.cs->get_round_state();
  REQUIRE(rs.round == 1);
  REQUIRE(rs.proposal_msg);
  CHECK(rs.proposal_msg->proposer_address == f.node.address);
  CHECK(rs.proposal_msg->block_id == p.block_id);
  CHECK(rs.proposal_msg->pol_round == 0);
}

TEST_CASE("consensus_state: Invalid proposals are dropped", "[consensus_state]") {
  single_node_fixture f(1);
  f.net.start();
  auto proposer = f.proposer_of(0);
  REQUIRE(proposer > 0);
  auto not_proposer = proposer == 1 ? 2 : 1;

  SECTION("wrong proposer") {
    f.node.cs->receive_proposal(f.propose_from(not_proposer, 0));
  }

  SECTION("bad signature") {
    auto p = f.propose_from(proposer, 0);
    p.timestamp += 1;
    f.node.cs->receive_proposal(p);
  }

  SECTION("block does not match id") {
    auto p = f.propose_from(proposer, 0);
    auto b = *p.block_;
    b.txs.push_back(to_bytes("extra"));
    p.block_ = std::make_shared<const block>(b);
    f.node.cs->receive_proposal(p);
  }

  SECTION("wrong height in block") {
    auto b = std::make_shared<const block>(
      block{2, get_time(), {}, f.other(proposer).get_pub_key().address(), {}});
    f.node.cs->receive_proposal(sign_test_proposal(f.other(proposer), 1, 0, -1, b));
  }

  SECTION("invalid pol round") {
    f.node.cs->receive_proposal(f.propose_from(proposer, 0, 0));
  }

  SECTION("rejected by the application") {
    f.node.app->block_validator = [](const block&) -> Result<void> { return Error("rejected"); };
    f.node.cs->receive_proposal(f.propose_from(proposer, 0));
  }

  f.net.run();
  auto rs = f.node.cs->get_round_state();
  CHECK(!rs.proposal_msg);
  CHECK(rs.step == round_step_type::Propose);

  // propose timeout leads to a nil prevote
  REQUIRE(f.net.fire_next());
  auto prevote = f.own_vote(Prevote, 0);
  REQUIRE(prevote);
  CHECK(prevote->is_nil());
}

TEST_CASE("consensus_state: Commit with a block from another round", "[consensus_state]") {
  single_node_fixture f(1);
  f.net.start();
  auto proposer = f.proposer_of(0);
  auto p = f.propose_from(proposer, 0);

  // precommits arrive before the proposal
  for (auto i = 1; i < 4; i++)
    f.precommit_from(i, p.block_id);
  auto rs = f.node.cs->get_round_state();
  CHECK(rs.step == round_step_type::Commit);
  CHECK(f.node.app->commits.empty());

  f.node.cs->receive_proposal(p, "peer");
  f.net.run();
  REQUIRE(f.node.app->commits.size() == 1);
  CHECK(f.node.app->commits[0].block_id == p.block_id);
  CHECK(f.node.cs->get_round_state().height == 2);
}

TEST_CASE("consensus_state: Application failure", "[consensus_state]") {
  single_node_fixture f;
  std::vector<Error> reported;
  f.node.cs->set_error_reporter([&](const Error& err) { reported.push_back(err); });
  f.node.app->fail_commits = 1;
  f.net.start();

  auto block_id = f.node.cs->get_round_state().proposal_msg->block_id;
  for (auto i = 1; i < 3; i++)
    f.prevote_from(i, block_id);
  for (auto i = 1; i < 3; i++)
    f.precommit_from(i, block_id);

  REQUIRE(reported.size() == 1);
  CHECK(f.node.app->commits.empty());
  auto rs = f.node.cs->get_round_state();
  CHECK(rs.height == 1);
  CHECK(rs.round == 1);
  REQUIRE(rs.locked_block);
  CHECK(rs.locked_block->hashes_to(block_id));

  // the commit is retried once the propose timeout of the new round fires
  REQUIRE(f.net.run_until([&]() { return f.node.cs->get_last_height() == 1; }));
  REQUIRE(f.node.app->commits.size() == 1);
  CHECK(f.node.app->commits[0].height == 1);
  CHECK(f.node.app->commits[0].block_id == block_id);
  CHECK(reported.size() == 1);
}

TEST_CASE("consensus_state: Non-validator does not vote", "[consensus_state]") {
  auto keys = rand_priv_keys(4);
  auto genesis = rand_genesis_state(keys);
  boost::asio::io_context ioc;
  auto ticker = std::make_shared<manual_timeout_ticker>();
  auto app = std::make_shared<test_application>();
  auto cs = consensus_state::new_state(
    test_config(), genesis, ioc.get_executor(), std::make_shared<ed25519_signer>(), app, nullptr, ticker);
  cs->on_start();
  ioc.run();

  for (auto i = 0; i < 3; i++) {
    REQUIRE(ticker->fire_next());
    ioc.restart();
    ioc.run();
  }
  CHECK(cs->votes->size() == 0);
  CHECK(cs->get_round_state().round == 1);

  // it still follows the commit of the validators
  auto proposer = genesis.validators->get_proposer(1, 1).address;
  auto it = std::find_if(
    keys.begin(), keys.end(), [&](const priv_key& k) { return k.get_pub_key().address() == proposer; });
  auto b = std::make_shared<const block>(genesis.make_block(1, {}, proposer, get_time()));
  auto p = sign_test_proposal(*it, 1, 1, -1, b);
  cs->receive_proposal(p);
  for (auto i = 0; i < 3; i++)
    cs->receive_vote(sign_test_vote(keys[i], Precommit, 1, 1, p.block_id));
  ioc.restart();
  ioc.run();
  REQUIRE(app->commits.size() == 1);
  CHECK(app->commits[0].block_id == p.block_id);
}

TEST_CASE("consensus_state: Commit does not depend on message order", "[consensus_state]") {
  auto keys = proposer_first(rand_priv_keys(4), 1, 0);
  auto genesis = rand_genesis_state(keys);
  auto proposer = keys[0].get_pub_key().address();
  auto b = std::make_shared<const block>(genesis.make_block(1, {to_bytes("tx")}, proposer, get_time()));
  auto p = sign_test_proposal(keys[0], 1, 0, -1, b);

  std::vector<msg_info_ptr> msgs;
  msgs.push_back(std::make_shared<msg_info>(msg_info{p, "peer"}));
  for (auto i = 0; i < 3; i++)
    msgs.push_back(std::make_shared<msg_info>(msg_info{sign_test_vote(keys[i], Precommit, 1, 0, p.block_id), "peer"}));
  msgs.push_back(std::make_shared<msg_info>(msg_info{sign_test_vote(keys[3], Precommit, 1, 0, {}), "peer"}));
  msgs.push_back(std::make_shared<msg_info>(msg_info{sign_test_vote(keys[3], Prevote, 1, 0, p.block_id), "peer"}));

  std::vector<size_t> order(msgs.size());
  std::iota(order.begin(), order.end(), 0);
  auto permutations = 0;
  do {
    boost::asio::io_context ioc;
    auto ticker = std::make_shared<manual_timeout_ticker>();
    auto app = std::make_shared<test_application>();
    auto cs = consensus_state::new_state(
      test_config(), genesis, ioc.get_executor(), std::make_shared<ed25519_signer>(), app, nullptr, ticker);
    cs->on_start();
    for (auto i : order)
      cs->send(msgs[i]);
    ioc.run();

    REQUIRE(app->commits.size() == 1);
    CHECK(app->commits[0].height == 1);
    CHECK(app->commits[0].block_id == p.block_id);
    CHECK(cs->get_round_state().height == 2);
    ++permutations;
  } while (std::next_permutation(order.begin(), order.end()));
  CHECK(permutations == 720);
}
