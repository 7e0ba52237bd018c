// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/hex.h>
#include <hybrid/consensus/consensus_state.h>
#include <hybrid/consensus/local_bus.h>
#include <hybrid/log/log.h>
#include <mutex>

namespace hybrid::consensus {

namespace {

class bus_endpoint : public transport {
public:
  bus_endpoint(std::shared_ptr<local_bus> bus, Bytes address): bus(std::move(bus)), address(std::move(address)) {}

  void broadcast_proposal(const proposal& p) override {
    bus->broadcast(address, std::make_shared<msg_info>(msg_info{p, to_hex(address)}));
  }

  void broadcast_vote(const vote& v) override {
    bus->broadcast(address, std::make_shared<msg_info>(msg_info{v, to_hex(address)}));
  }

  void broadcast_commit_request(const commit_request& r) override {
    bus->broadcast(address, std::make_shared<msg_info>(msg_info{r, to_hex(address)}));
  }

private:
  std::shared_ptr<local_bus> bus;
  Bytes address;
};

} // namespace

std::shared_ptr<transport> local_bus::endpoint(const Bytes& address) {
  return std::make_shared<bus_endpoint>(shared_from_this(), address);
}

void local_bus::attach(const Bytes& address, std::weak_ptr<consensus_state> cs) {
  std::unique_lock g(mtx);
  peers[address] = std::move(cs);
}

void local_bus::detach(const Bytes& address) {
  std::unique_lock g(mtx);
  peers.erase(address);
}

void local_bus::set_filter(filter_type f) {
  std::unique_lock g(mtx);
  filter = std::move(f);
}

void local_bus::deliver(const Bytes& from, const Bytes& to, msg_info_ptr mi) {
  std::shared_ptr<consensus_state> cs;
  {
    std::shared_lock g(mtx);
    auto it = peers.find(to);
    if (it == peers.end()) {
      dlog("no peer attached: to={}", to_hex(to));
      return;
    }
    cs = it->second.lock();
  }
  if (cs)
    transmit(envelope{from, to, false, std::move(mi)}, cs);
}

void local_bus::broadcast(const Bytes& from, msg_info_ptr mi) {
  std::vector<std::pair<Bytes, std::shared_ptr<consensus_state>>> targets;
  {
    std::shared_lock g(mtx);
    for (const auto& [address, peer] : peers) {
      if (address == from)
        continue;
      if (auto cs = peer.lock())
        targets.emplace_back(address, std::move(cs));
    }
  }
  for (const auto& [address, cs] : targets) {
    transmit(envelope{from, address, true, mi}, cs);
  }
}

size_t local_bus::dropped() const {
  std::shared_lock g(mtx);
  return dropped_;
}

void local_bus::transmit(const envelope& env, const std::shared_ptr<consensus_state>& cs) {
  {
    std::unique_lock g(mtx);
    if (filter && !filter(env)) {
      ++dropped_;
      return;
    }
  }
  cs->send(env.message);
}

} // namespace hybrid::consensus
