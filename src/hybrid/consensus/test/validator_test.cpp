// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <hybrid/common/hex.h>
#include <hybrid/consensus/validator.h>
#include <algorithm>

using namespace hybrid;
using namespace hybrid::consensus;

namespace {

Bytes test_address(int i) {
  Bytes addr(address_size, 0);
  addr.back() = static_cast<unsigned char>(i);
  return addr;
}

validator_set make_set(const std::vector<int64_t>& powers) {
  std::vector<validator> vals;
  for (auto i = 0u; i < powers.size(); i++)
    vals.push_back(validator{test_address(i), {}, powers[i]});
  return validator_set::new_validator_set(std::move(vals)).value();
}

std::vector<vote> votes_from(const validator_set& vals, size_t count) {
  std::vector<vote> votes;
  for (auto i = 0u; i < count; i++)
    votes.push_back(vote{Prevote, 1, 0, {}, 0, vals.validators[i].address});
  return votes;
}

} // namespace

TEST_CASE("validator_set: Basic", "[hybrid][consensus]") {
  SECTION("sorted by address") {
    auto vals = validator_set::new_validator_set(
      {validator{test_address(3), {}, 10}, validator{test_address(1), {}, 20}, validator{test_address(2), {}, 30}});
    REQUIRE(vals);
    CHECK(vals.value().validators[0].address == test_address(1));
    CHECK(vals.value().validators[2].address == test_address(3));
    CHECK(vals.value().total_voting_power == 60);
  }

  SECTION("get by address") {
    auto vals = make_set({10, 20, 30});
    CHECK(vals.has_address(test_address(1)));
    CHECK(!vals.has_address(test_address(9)));
    CHECK(vals.get_by_address(test_address(2))->voting_power == 30);
    CHECK(vals.get_by_address(test_address(9)) == nullptr);
    CHECK(vals.get_index_by_address(test_address(2)) == 2);
    CHECK(vals.get_index_by_address(test_address(9)) == -1);
  }

  SECTION("invalid sets") {
    CHECK(!validator_set::new_validator_set({validator{test_address(1), {}, 0}}));
    CHECK(!validator_set::new_validator_set({validator{test_address(1), {}, -5}}));
    CHECK(!validator_set::new_validator_set({validator{from_hex("0102"), {}, 10}}));
    CHECK(!validator_set::new_validator_set({validator{test_address(1), {}, 10}, validator{test_address(1), {}, 20}}));
    CHECK(!validator_set::new_validator_set(
      {validator{test_address(1), {}, max_total_voting_power}, validator{test_address(2), {}, 1}}));
  }

  SECTION("address must match public key") {
    auto pub = priv_key::new_priv_key().get_pub_key();
    CHECK(validator_set::new_validator_set({validator::new_validator(pub, 10)}));
    CHECK(!validator_set::new_validator_set({validator{test_address(1), pub, 10}}));
  }
}

TEST_CASE("validator_set: Quorum", "[hybrid][consensus]") {
  SECTION("three validators of equal power") {
    auto vals = make_set({1, 1, 1});
    CHECK(!vals.has_quorum(votes_from(vals, 2)));
    CHECK(vals.has_quorum(votes_from(vals, 3)));
  }

  SECTION("ten validators of equal power") {
    auto vals = make_set(std::vector<int64_t>(10, 1));
    CHECK(!vals.has_quorum(votes_from(vals, 6)));
    CHECK(vals.has_quorum(votes_from(vals, 7)));
  }

  SECTION("four validators of equal power") {
    auto vals = make_set({10, 10, 10, 10});
    CHECK(!vals.is_quorum(20));
    CHECK(vals.is_quorum(30));
  }

  SECTION("weighted") {
    auto vals = make_set({70, 10, 10, 10});
    CHECK(vals.has_quorum(votes_from(vals, 1)));
    CHECK(!vals.is_quorum(66));
    CHECK(vals.is_quorum(67));
  }

  SECTION("duplicate and unknown votes") {
    auto vals = make_set({10, 10, 10});
    auto votes = votes_from(vals, 2);
    votes.push_back(votes[0]);
    votes.push_back(vote{Prevote, 1, 0, {}, 0, test_address(9)});
    CHECK(vals.power_of(votes) == 20);
    CHECK(!vals.has_quorum(votes));
  }

  SECTION("order of votes does not matter") {
    auto vals = make_set({5, 7, 11, 13});
    auto votes = votes_from(vals, 3);
    auto power = vals.power_of(votes);
    auto by_address = [](const vote& a, const vote& b) { return a.validator_address < b.validator_address; };
    std::sort(votes.begin(), votes.end(), by_address);
    do {
      CHECK(vals.power_of(votes) == power);
    } while (std::next_permutation(votes.begin(), votes.end(), by_address));
  }
}

TEST_CASE("validator_set: Proposer Selection", "[hybrid][consensus]") {
  auto vals = make_set({100, 100, 400});

  SECTION("round robin over address order") {
    for (auto h = 1; h < 10; h++) {
      for (auto r = 0; r < 5; r++) {
        CHECK(vals.get_proposer(h, r).address == test_address((h + r) % 3));
      }
    }
  }

  SECTION("deterministic across instances") {
    auto other = make_set({100, 100, 400});
    for (auto h = 1; h < 20; h++)
      CHECK(vals.get_proposer(h, 0).address == other.get_proposer(h, 0).address);
  }

  SECTION("empty set") {
    validator_set empty;
    CHECK_THROWS(empty.get_proposer(1, 0));
  }
}

TEST_CASE("validator_set: Apply updates", "[hybrid][consensus]") {
  auto k1 = priv_key::new_priv_key().get_pub_key();
  auto k2 = priv_key::new_priv_key().get_pub_key();
  auto k3 = priv_key::new_priv_key().get_pub_key();
  auto vals =
    validator_set::new_validator_set({validator::new_validator(k1, 10, "a"), validator::new_validator(k2, 10, "b")})
      .value();

  SECTION("add, change and remove") {
    auto updated = vals.apply_updates({{k3, 5}, {k1, 0}, {k2, 30}});
    REQUIRE(updated);
    CHECK(updated.value().size() == 2);
    CHECK(!updated.value().has_address(k1.address()));
    CHECK(updated.value().get_by_address(k2.address())->voting_power == 30);
    CHECK(updated.value().get_by_address(k2.address())->name == "b");
    CHECK(updated.value().get_by_address(k3.address())->voting_power == 5);
    CHECK(updated.value().total_voting_power == 35);
    // the original set is untouched
    CHECK(vals.total_voting_power == 20);
  }

  SECTION("no updates") {
    auto updated = vals.apply_updates({});
    REQUIRE(updated);
    CHECK(updated.value().validators.size() == 2);
  }

  SECTION("invalid updates") {
    CHECK(!vals.apply_updates({{k3, 0}}));
    CHECK(!vals.apply_updates({{k1, -1}}));
    CHECK(!vals.apply_updates({{k1, 5}, {k1, 6}}));
    CHECK(!vals.apply_updates({{k1, 0}, {k2, 0}}));
  }
}
