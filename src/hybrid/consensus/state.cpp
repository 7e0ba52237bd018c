// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/hex.h>
#include <hybrid/consensus/state.h>
#include <algorithm>

namespace hybrid::consensus {

namespace {
  ::hybrid::types::Validator validator_to_proto(const validator& v) {
    ::hybrid::types::Validator pb;
    pb.set_address({v.address.begin(), v.address.end()});
    pb.set_pub_key({v.pub_key_.key.begin(), v.pub_key_.key.end()});
    pb.set_voting_power(v.voting_power);
    pb.set_name(v.name);
    return pb;
  }

  template<typename Validators>
  Result<std::shared_ptr<const validator_set>> validator_set_from_proto(const Validators& pbs) {
    std::vector<validator> vals;
    for (const auto& pb : pbs) {
      vals.push_back(validator{{pb.address().begin(), pb.address().end()},
        {{pb.pub_key().begin(), pb.pub_key().end()}}, pb.voting_power(), pb.name()});
    }
    auto set = validator_set::new_validator_set(std::move(vals));
    if (!set) {
      return set.error();
    }
    return std::make_shared<const validator_set>(std::move(set.value()));
  }
} // namespace

Result<state> state::make_genesis_state(const genesis_doc& gen_doc) {
  if (auto ok = gen_doc.validate_and_complete(); !ok) {
    return ok.error();
  }
  std::vector<validator> vals;
  for (const auto& val : gen_doc.validators) {
    vals.push_back(validator{val.address, val.pub_key_, val.power, val.name});
  }
  auto val_set = validator_set::new_validator_set(std::move(vals));
  if (!val_set) {
    return val_set.error();
  }

  state state_{};
  state_.chain_id = gen_doc.chain_id;
  state_.initial_height = gen_doc.initial_height;
  state_.last_block_height = 0;
  state_.last_block_id = {};
  state_.last_block_time = gen_doc.genesis_time;
  state_.validators = std::make_shared<const validator_set>(std::move(val_set.value()));
  state_.last_validators = std::make_shared<const validator_set>();
  return state_;
}

block state::make_block(int64_t height, std::vector<Bytes> txs, const Bytes& proposer_address, tstamp now) const {
  // block time is strictly increasing
  auto min_time = last_block_time + std::chrono::microseconds(std::chrono::milliseconds(1)).count();
  return block{height, std::max(now, min_time), last_block_id, proposer_address, std::move(txs)};
}

Result<void> state::validate_block(const block& b) const {
  if (auto ok = b.validate_basic(); !ok) {
    return ok.error();
  }
  if (b.height != next_height()) {
    return Error::format("wrong block height: expected {}, got {}", next_height(), b.height);
  }
  if (b.last_block_id != last_block_id) {
    return Error::format(
      "wrong last block id: expected {}, got {}", to_hex(last_block_id), to_hex(b.last_block_id));
  }
  if (b.time <= last_block_time) {
    return Error::format("block time {} is not after last block time {}", b.time, last_block_time);
  }
  if (!validators->has_address(b.proposer_address)) {
    return Error::format("block proposer {} is not a validator", to_hex(b.proposer_address));
  }
  return success();
}

Result<state> state::apply_block(
  const Bytes& block_id, const block& b, const std::vector<validator_update>& updates) const {
  if (b.height != next_height()) {
    return Error::format("apply_block: expected height {}, got {}", next_height(), b.height);
  }
  auto next = *this;
  next.last_block_height = b.height;
  next.last_block_id = block_id;
  next.last_block_time = b.time;
  next.last_validators = validators;
  if (!updates.empty()) {
    auto val_set = validators->apply_updates(updates);
    if (!val_set) {
      return val_set.error();
    }
    next.validators = std::make_shared<const validator_set>(std::move(val_set.value()));
  }
  return next;
}

::hybrid::store::State state::to_proto() const {
  ::hybrid::store::State pb;
  pb.set_chain_id(chain_id);
  pb.set_initial_height(initial_height);
  pb.set_last_block_height(last_block_height);
  pb.set_last_block_id({last_block_id.begin(), last_block_id.end()});
  pb.set_last_block_time(last_block_time);
  if (validators) {
    for (const auto& v : validators->validators)
      *pb.add_validators() = validator_to_proto(v);
  }
  if (last_validators) {
    for (const auto& v : last_validators->validators)
      *pb.add_last_validators() = validator_to_proto(v);
  }
  return pb;
}

Result<state> state::from_proto(const ::hybrid::store::State& pb) {
  state ret{};
  ret.chain_id = pb.chain_id();
  ret.initial_height = pb.initial_height();
  ret.last_block_height = pb.last_block_height();
  ret.last_block_id = {pb.last_block_id().begin(), pb.last_block_id().end()};
  ret.last_block_time = pb.last_block_time();
  if (ret.chain_id.empty() || ret.initial_height < 1 || ret.last_block_height < 0) {
    return Error("invalid state");
  }
  if (ret.last_block_height > 0 && ret.last_block_id.size() != 32) {
    return Error("invalid state: missing last block id");
  }
  auto vals = validator_set_from_proto(pb.validators());
  if (!vals) {
    return vals.error();
  }
  if (vals.value()->empty()) {
    return Error("invalid state: empty validator set");
  }
  ret.validators = vals.value();
  if (pb.last_validators_size() > 0) {
    auto last_vals = validator_set_from_proto(pb.last_validators());
    if (!last_vals) {
      return last_vals.error();
    }
    ret.last_validators = last_vals.value();
  } else {
    ret.last_validators = std::make_shared<const validator_set>();
  }
  return ret;
}

} // namespace hybrid::consensus
