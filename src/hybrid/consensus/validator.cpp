// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/check.h>
#include <hybrid/common/hex.h>
#include <hybrid/consensus/validator.h>
#include <algorithm>
#include <set>

namespace hybrid::consensus {

namespace {
  bool by_address(const validator& a, const validator& b) {
    return a.address < b.address;
  }
} // namespace

Result<validator_set> validator_set::new_validator_set(std::vector<validator> validator_list) {
  std::sort(validator_list.begin(), validator_list.end(), by_address);
  int64_t sum{};
  for (auto i = 0u; i < validator_list.size(); i++) {
    const auto& val = validator_list[i];
    if (val.address.size() != address_size) {
      return Error::format("validator {} has invalid address size {}", i, val.address.size());
    }
    if (!val.pub_key_.empty() && val.pub_key_.address() != val.address) {
      return Error::format("validator {} address does not match its public key", i);
    }
    if (val.voting_power <= 0) {
      return Error::format("validator {} has non-positive voting power {}", i, val.voting_power);
    }
    if (i > 0 && validator_list[i - 1].address == val.address) {
      return Error::format("duplicate validator address at {}", i);
    }
    if (val.voting_power > max_total_voting_power - sum) {
      return Error::format("total voting power exceeds maximum allowed {}", max_total_voting_power);
    }
    sum += val.voting_power;
  }
  return validator_set{std::move(validator_list), sum};
}

bool validator_set::has_address(const Bytes& address) const {
  return get_by_address(address) != nullptr;
}

const validator* validator_set::get_by_address(const Bytes& address) const {
  auto it = std::lower_bound(validators.begin(), validators.end(), address,
    [](const validator& v, const Bytes& addr) { return v.address < addr; });
  if (it == validators.end() || it->address != address)
    return nullptr;
  return &*it;
}

int32_t validator_set::get_index_by_address(const Bytes& address) const {
  if (auto val = get_by_address(address); val) {
    return static_cast<int32_t>(val - validators.data());
  }
  return -1;
}

const validator& validator_set::get_proposer(int64_t height, int32_t round) const {
  check(!validators.empty(), "get_proposer: empty validator set");
  check(height >= 0 && round >= 0, "get_proposer: invalid height={} round={}", height, round);
  auto index = (static_cast<uint64_t>(height) + static_cast<uint64_t>(round)) % validators.size();
  return validators[index];
}

int64_t validator_set::power_of(const std::vector<vote>& votes) const {
  std::set<Bytes> seen;
  int64_t power{};
  for (const auto& v : votes) {
    auto val = get_by_address(v.validator_address);
    if (!val)
      continue;
    if (seen.insert(v.validator_address).second)
      power += val->voting_power;
  }
  return power;
}

Result<validator_set> validator_set::apply_updates(const std::vector<validator_update>& updates) const {
  std::vector<validator> changes;
  for (const auto& u : updates) {
    if (u.power < 0) {
      return Error::format("validator update has negative voting power {}", u.power);
    }
    changes.push_back(validator::new_validator(u.pub_key_, u.power));
  }
  std::sort(changes.begin(), changes.end(), by_address);
  for (auto i = 1u; i < changes.size(); i++) {
    if (changes[i - 1].address == changes[i].address) {
      return Error::format("duplicate validator update for {}", to_hex(changes[i].address));
    }
  }

  // merge sorted lists; updates win on equal addresses
  std::vector<validator> merged;
  merged.reserve(validators.size() + changes.size());
  auto existing = validators.begin();
  auto change = changes.begin();
  while (existing != validators.end() || change != changes.end()) {
    if (change == changes.end() || (existing != validators.end() && existing->address < change->address)) {
      merged.push_back(*existing++);
      continue;
    }
    bool replaces = existing != validators.end() && existing->address == change->address;
    if (change->voting_power == 0) {
      if (!replaces) {
        return Error("failed to remove a validator which is not in the set");
      }
    } else {
      auto val = *change;
      if (replaces && val.name.empty())
        val.name = existing->name;
      merged.push_back(std::move(val));
    }
    if (replaces)
      ++existing;
    ++change;
  }

  if (merged.empty()) {
    return Error("applying the validator updates would result in an empty set");
  }
  return new_validator_set(std::move(merged));
}

} // namespace hybrid::consensus
