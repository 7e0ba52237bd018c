// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/consensus/canonical.h>
#include <hybrid/consensus/errors.h>
#include <hybrid/consensus/vote_store.h>

namespace hybrid::consensus {

vote_store::vote_store(std::string chain_id_, std::shared_ptr<signer> s, int32_t max_future_rounds_)
  : chain_id(std::move(chain_id_)), signer_(std::move(s)), max_future_rounds(max_future_rounds_) {}

void vote_store::reset(
  int64_t height, std::shared_ptr<const validator_set> vals_, std::shared_ptr<const validator_set> last_vals_) {
  if (!last_vals_ && height == height_ + 1) {
    last_vals_ = vals;
  }
  height_ = height;
  round_ = 0;
  vals = std::move(vals_);
  last_vals = std::move(last_vals_);
  votes.erase(votes.begin(), votes.lower_bound(vote_key{height - 1, 0, Unknown, {}}));
}

void vote_store::set_round(int32_t round) {
  round_ = round;
}

const validator_set* vote_store::validators_at(int64_t height) const {
  if (height == height_)
    return vals.get();
  if (height + 1 == height_)
    return last_vals.get();
  return nullptr;
}

Result<add_vote_result> vote_store::add_vote(const vote& v) {
  if (v.type != Prevote && v.type != Precommit) {
    return err_invalid_vote_type;
  }
  if (v.height > height_) {
    return err_future_height;
  }
  // only precommits of the previous height are retained, to observe the last commit
  if (v.height < height_ && !(v.height + 1 == height_ && v.type == Precommit)) {
    return err_stale_height;
  }
  if (v.round < 0) {
    return Error::format("invalid vote round {}", v.round);
  }
  if (v.height == height_ && v.round > round_ + max_future_rounds) {
    return err_round_too_far;
  }
  if (!v.block_id.empty() && v.block_id.size() != 32) {
    return Error::format("invalid block id size {}", v.block_id.size());
  }

  auto val_set = validators_at(v.height);
  if (!val_set || !val_set->has_address(v.validator_address)) {
    return err_unknown_validator;
  }
  if (!signer_->verify(v.validator_address, canonical::vote_sign_bytes(chain_id, v), v.signature)) {
    return err_invalid_signature;
  }

  auto [it, inserted] = votes.try_emplace(vote_key{v.height, v.round, v.type, v.validator_address}, v);
  if (inserted) {
    return add_vote_result::accepted;
  }
  it->second = v;
  return add_vote_result::replaced;
}

std::vector<vote> vote_store::get_votes(int64_t height, int32_t round, signed_msg_type type) const {
  std::vector<vote> ret;
  for_each_vote(height, round, type, [&](const vote& v) { ret.push_back(v); });
  return ret;
}

int64_t vote_store::power_for_block(int64_t height, int32_t round, signed_msg_type type, const Bytes& block_id) const {
  auto val_set = validators_at(height);
  if (!val_set)
    return 0;
  int64_t power{};
  for_each_vote(height, round, type, [&](const vote& v) {
    if (v.block_id != block_id)
      return;
    if (auto val = val_set->get_by_address(v.validator_address); val)
      power += val->voting_power;
  });
  return power;
}

int64_t vote_store::total_power(int64_t height, int32_t round, signed_msg_type type) const {
  auto val_set = validators_at(height);
  if (!val_set)
    return 0;
  int64_t power{};
  for_each_vote(height, round, type, [&](const vote& v) {
    if (auto val = val_set->get_by_address(v.validator_address); val)
      power += val->voting_power;
  });
  return power;
}

std::optional<Bytes> vote_store::two_thirds_majority(int64_t height, int32_t round, signed_msg_type type) const {
  auto val_set = validators_at(height);
  if (!val_set)
    return {};
  std::map<Bytes, int64_t> power_by_block;
  for_each_vote(height, round, type, [&](const vote& v) {
    if (auto val = val_set->get_by_address(v.validator_address); val)
      power_by_block[v.block_id] += val->voting_power;
  });
  for (const auto& [block_id, power] : power_by_block) {
    if (val_set->is_quorum(power))
      return block_id;
  }
  return {};
}

bool vote_store::has_two_thirds_any(int64_t height, int32_t round, signed_msg_type type) const {
  auto val_set = validators_at(height);
  return val_set && val_set->is_quorum(total_power(height, round, type));
}

bool vote_store::has_all(int64_t height, int32_t round, signed_msg_type type) const {
  auto val_set = validators_at(height);
  return val_set && total_power(height, round, type) == val_set->total_voting_power;
}

std::optional<std::pair<int32_t, Bytes>> vote_store::find_commit(int64_t height) const {
  auto it = votes.lower_bound(vote_key{height, 0, Unknown, {}});
  std::optional<int32_t> last_round;
  for (; it != votes.end() && it->first.height == height; ++it) {
    const auto& k = it->first;
    if (k.type != Precommit || k.round == last_round)
      continue;
    last_round = k.round;
    if (auto maj = two_thirds_majority(height, k.round, Precommit); maj && !maj->empty())
      return std::make_pair(k.round, *maj);
  }
  return {};
}

} // namespace hybrid::consensus
