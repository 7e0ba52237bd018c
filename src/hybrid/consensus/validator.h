// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/crypto.h>
#include <hybrid/consensus/vote.h>
#include <limits>
#include <memory>
#include <vector>

namespace hybrid::consensus {

// The maximum allowed total voting power.
// Keeps `power * 3` in quorum checks far from overflowing int64.
constexpr int64_t max_total_voting_power{std::numeric_limits<int64_t>::max() / 8};

struct validator {
  Bytes address;
  pub_key pub_key_;
  int64_t voting_power;
  std::string name;

  static validator new_validator(const pub_key& key, int64_t voting_power, std::string name = {}) {
    return validator{key.address(), key, voting_power, std::move(name)};
  }
};

/// \brief change to the validator set returned by the application on commit
/// A power of 0 removes the validator.
struct validator_update {
  pub_key pub_key_;
  int64_t power;
};

/**
 * Set of validators effective for a single height.
 * Validators are kept sorted by address, which fixes the enumeration order used for proposer selection.
 * A set is never mutated once constructed; changes produce a new set at a height boundary.
 */
struct validator_set {
  std::vector<validator> validators;
  int64_t total_voting_power = 0;

  /// \brief builds a set sorted by address
  /// Fails on duplicate addresses, non-positive powers, or total power above max_total_voting_power.
  static Result<validator_set> new_validator_set(std::vector<validator> validator_list);

  size_t size() const {
    return validators.size();
  }

  bool empty() const {
    return validators.empty();
  }

  bool has_address(const Bytes& address) const;
  const validator* get_by_address(const Bytes& address) const;
  int32_t get_index_by_address(const Bytes& address) const;

  /// \brief returns the proposer for (height, round)
  /// The validator at index `(height + round) mod N`.
  const validator& get_proposer(int64_t height, int32_t round) const;

  /// \brief true iff `power * 3 > total_voting_power * 2`
  bool is_quorum(int64_t power) const {
    return power * 3 > total_voting_power * 2;
  }

  /// \brief sums voting power of votes, counting each known validator once and skipping unknown ones
  int64_t power_of(const std::vector<vote>& votes) const;

  bool has_quorum(const std::vector<vote>& votes) const {
    return is_quorum(power_of(votes));
  }

  /// \brief returns a new set with the updates merged in
  Result<validator_set> apply_updates(const std::vector<validator_update>& updates) const;
};

} // namespace hybrid::consensus
