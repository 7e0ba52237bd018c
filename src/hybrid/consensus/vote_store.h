// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/signer.h>
#include <hybrid/consensus/validator.h>
#include <compare>
#include <map>
#include <memory>
#include <optional>

namespace hybrid::consensus {

enum class add_vote_result {
  accepted,
  replaced
};

struct vote_key {
  int64_t height;
  int32_t round;
  signed_msg_type type;
  Bytes validator_address;

  auto operator<=>(const vote_key&) const = default;
};

/**
 * Collects signed votes of the current height and the one before.
 *
 * At most one vote is kept per (height, round, type, validator); a later vote replaces the earlier one,
 * so the power of a validator is never counted twice. Quorum is evaluated per block id.
 * Rejected votes are reported as errors from add_vote.
 * NOTE: not thread safe
 */
class vote_store {
public:
  vote_store(std::string chain_id, std::shared_ptr<signer> signer_, int32_t max_future_rounds);

  /// \brief moves to \p height, dropping votes below \p height - 1
  void reset(int64_t height, std::shared_ptr<const validator_set> vals,
    std::shared_ptr<const validator_set> last_vals = nullptr);

  /// \brief sets the current round; votes beyond round + max_future_rounds are rejected
  void set_round(int32_t round);

  Result<add_vote_result> add_vote(const vote& v);

  std::vector<vote> get_votes(int64_t height, int32_t round, signed_msg_type type) const;

  /// \brief sums voting power of votes for \p block_id (empty for nil)
  int64_t power_for_block(int64_t height, int32_t round, signed_msg_type type, const Bytes& block_id) const;

  /// \brief sums voting power of all votes regardless of block id
  int64_t total_power(int64_t height, int32_t round, signed_msg_type type) const;

  /// \brief returns the block id (empty for nil) which has 2/3+ of voting power, if any
  std::optional<Bytes> two_thirds_majority(int64_t height, int32_t round, signed_msg_type type) const;

  /// \brief true if 2/3+ of voting power voted, for any mix of block ids
  bool has_two_thirds_any(int64_t height, int32_t round, signed_msg_type type) const;

  /// \brief true if every validator voted
  bool has_all(int64_t height, int32_t round, signed_msg_type type) const;

  /// \brief finds a round of \p height with 2/3+ precommits for a block
  std::optional<std::pair<int32_t, Bytes>> find_commit(int64_t height) const;

  size_t size() const {
    return votes.size();
  }

  int64_t height() const {
    return height_;
  }

private:
  const validator_set* validators_at(int64_t height) const;

  template<typename F>
  void for_each_vote(int64_t height, int32_t round, signed_msg_type type, F&& f) const {
    auto it = votes.lower_bound(vote_key{height, round, type, {}});
    for (; it != votes.end(); ++it) {
      const auto& k = it->first;
      if (k.height != height || k.round != round || k.type != type)
        break;
      f(it->second);
    }
  }

  std::string chain_id;
  std::shared_ptr<signer> signer_;
  int32_t max_future_rounds;

  int64_t height_{0};
  int32_t round_{0};
  std::shared_ptr<const validator_set> vals;
  std::shared_ptr<const validator_set> last_vals;
  std::map<vote_key, vote> votes;
};

} // namespace hybrid::consensus
