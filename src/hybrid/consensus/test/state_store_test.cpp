// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <hybrid/common/file.h>
#include <hybrid/consensus/state_store.h>
#include <hybrid/consensus/test/common_test.h>
#include <filesystem>

using namespace hybrid;
using namespace hybrid::consensus;
using namespace hybrid::consensus::test;

namespace fs = std::filesystem;

namespace {

struct temp_dir {
  temp_dir(): path(fs::temp_directory_path() / "hybrid_state_store_test") {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~temp_dir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  fs::path path;
};

} // namespace

TEST_CASE("state_store: Save and load", "[hybrid][consensus]") {
  temp_dir dir;
  state_store store(dir.path / "data" / "state.json");

  SECTION("nothing saved yet") {
    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(!loaded.value());
  }

  SECTION("round trip") {
    auto keys = rand_priv_keys(3);
    auto genesis = rand_genesis_state(keys);
    auto b = genesis.make_block(1, {to_bytes("tx")}, keys[0].get_pub_key().address(), get_time());
    auto next = genesis.apply_block(b.get_hash(), b, {{keys[1].get_pub_key(), 25}});
    REQUIRE(next);

    REQUIRE(store.save(next.value()));
    CHECK(fs::exists(store.path()));
    auto tmp = store.path();
    tmp += ".tmp";
    CHECK(!fs::exists(tmp));

    auto loaded = store.load();
    REQUIRE(loaded);
    REQUIRE(loaded.value());
    const auto& s = *loaded.value();
    CHECK(s.chain_id == test_chain_id);
    CHECK(s.last_block_height == 1);
    CHECK(s.last_block_id == b.get_hash());
    CHECK(s.last_block_time == b.time);
    CHECK(s.next_height() == 2);
    CHECK(s.validators->total_voting_power == 45);
    CHECK(s.validators->get_by_address(keys[1].get_pub_key().address())->voting_power == 25);
    CHECK(s.last_validators->total_voting_power == 30);

    // saving again replaces the file
    auto b2 = s.make_block(2, {}, keys[0].get_pub_key().address(), get_time());
    auto next2 = s.apply_block(b2.get_hash(), b2, {});
    REQUIRE(next2);
    REQUIRE(store.save(next2.value()));
    CHECK(store.load().value()->last_block_height == 2);
  }

  SECTION("corrupt file") {
    REQUIRE(write_file_atomic(store.path(), "{ not json"));
    auto loaded = store.load();
    REQUIRE(!loaded);
    CHECK(loaded.error().message().find("corrupted state file") != std::string::npos);
  }

  SECTION("invalid contents") {
    REQUIRE(write_file_atomic(store.path(), R"({"chain_id": "c", "initial_height": "1"})"));
    CHECK(!store.load());
  }
}

TEST_CASE("state_store: Consensus persists commits", "[hybrid][consensus]") {
  temp_dir dir;
  auto store = std::make_shared<state_store>(dir.path / "state.json");
  auto keys = rand_priv_keys(1);
  auto genesis = rand_genesis_state(keys);

  boost::asio::io_context ioc;
  auto run = [&]() {
    ioc.restart();
    ioc.poll();
  };

  auto ticker = std::make_shared<manual_timeout_ticker>();
  auto app = std::make_shared<test_application>();
  auto cs = consensus_state::new_state(test_config(), genesis, ioc.get_executor(),
    std::make_shared<ed25519_signer>(keys[0]), app, nullptr, ticker, store);
  cs->on_start();
  run();

  // a single validator commits on its own votes
  REQUIRE(app->commits.size() == 1);
  for (auto i = 0; i < 2; i++) {
    REQUIRE(ticker->fire_next());
    run();
  }
  REQUIRE(app->commits.size() == 3);

  auto saved = store->load();
  REQUIRE(saved);
  REQUIRE(saved.value());
  CHECK(saved.value()->last_block_height == 3);
  CHECK(saved.value()->last_block_id == app->commits.back().block_id);
  cs->on_stop();

  SECTION("restart from the saved state") {
    auto ticker2 = std::make_shared<manual_timeout_ticker>();
    auto app2 = std::make_shared<test_application>();
    auto restarted = consensus_state::new_state(test_config(), *saved.value(), ioc.get_executor(),
      std::make_shared<ed25519_signer>(keys[0]), app2, nullptr, ticker2, store);
    CHECK(restarted->get_round_state().height == 4);
    restarted->on_start();
    run();
    REQUIRE(app2->commits.size() == 1);
    CHECK(app2->commits[0].height == 4);
    CHECK(app2->commits[0].block_.last_block_id == app->commits.back().block_id);
    CHECK(store->load().value()->last_block_height == 4);
  }

  SECTION("save failure is fatal") {
    auto ticker2 = std::make_shared<manual_timeout_ticker>();
    auto blocked = std::make_shared<state_store>(dir.path / "state.json" / "nested.json");
    auto restarted = consensus_state::new_state(test_config(), *saved.value(), ioc.get_executor(),
      std::make_shared<ed25519_signer>(keys[0]), std::make_shared<test_application>(), nullptr, ticker2, blocked);
    std::vector<std::string> errors;
    restarted->set_error_reporter([&](const Error& e) { errors.push_back(e.message()); });
    restarted->on_start();
    CHECK_THROWS_AS(run(), std::runtime_error);
    CHECK(errors.size() == 1);
  }
}

TEST_CASE("state_store: Decided block is replayed after a restart", "[hybrid][consensus]") {
  temp_dir dir;
  auto store = std::make_shared<state_store>(dir.path / "state.json");
  auto keys = rand_priv_keys(1);
  auto genesis = rand_genesis_state(keys);
  auto b = genesis.make_block(1, {to_bytes("decided")}, keys[0].get_pub_key().address(), get_time());

  boost::asio::io_context ioc;
  auto run = [&]() {
    ioc.restart();
    ioc.poll();
  };
  auto ticker = std::make_shared<manual_timeout_ticker>();
  auto app = std::make_shared<test_application>();
  auto start = [&]() {
    return consensus_state::new_state(test_config(), genesis, ioc.get_executor(),
      std::make_shared<ed25519_signer>(keys[0]), app, nullptr, ticker, store);
  };

  SECTION("the saved block is committed without a new round") {
    // decided in round 2 but never handed to the application
    REQUIRE(store->save(genesis, decided_block{1, 2, b.get_hash(), b}));
    CHECK(store->load().value()->last_block_height == 0);
    auto decided = store->load_decided();
    REQUIRE(decided);
    REQUIRE(decided.value());
    CHECK(decided.value()->round == 2);
    CHECK(decided.value()->block_.get_hash() == b.get_hash());

    auto cs = start();
    cs->on_start();
    run();
    REQUIRE(app->commits.size() == 1);
    CHECK(app->commits[0].height == 1);
    CHECK(app->commits[0].block_id == b.get_hash());
    CHECK(app->create_count == 0);
    CHECK(cs->get_round_state().height == 2);
    CHECK(store->load().value()->last_block_height == 1);
    auto cleared = store->load_decided();
    REQUIRE(cleared);
    CHECK(!cleared.value());
  }

  SECTION("an application failure retries the same block") {
    REQUIRE(store->save(genesis, decided_block{1, 0, b.get_hash(), b}));
    std::vector<std::string> errors;
    app->fail_commits = 1;
    auto cs = start();
    cs->set_error_reporter([&](const Error& e) { errors.push_back(e.message()); });
    cs->on_start();
    run();
    CHECK(errors.size() == 1);
    // a single validator re-proposes the locked block and commits it
    REQUIRE(app->commits.size() == 1);
    CHECK(app->commits[0].block_id == b.get_hash());
    CHECK(app->create_count == 0);
    CHECK(store->load().value()->last_block_height == 1);
  }

  SECTION("a block not matching its id is rejected") {
    auto other = genesis.make_block(1, {to_bytes("other")}, keys[0].get_pub_key().address(), get_time());
    REQUIRE(store->save(genesis, decided_block{1, 0, other.get_hash(), b}));
    auto decided = store->load_decided();
    REQUIRE(!decided);
    CHECK(decided.error().message().find("corrupted state file") != std::string::npos);
    CHECK_THROWS_AS(start(), std::runtime_error);
  }

  SECTION("a block at another height is rejected") {
    auto later = genesis.make_block(2, {}, keys[0].get_pub_key().address(), get_time());
    REQUIRE(store->save(genesis, decided_block{2, 0, later.get_hash(), later}));
    CHECK(!store->load_decided());
    CHECK_THROWS_AS(start(), std::runtime_error);
  }
}
