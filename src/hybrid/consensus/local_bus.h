// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/transport.h>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>

namespace hybrid::consensus {

struct consensus_state;

struct envelope {
  Bytes from;
  Bytes to;
  bool broadcast;
  msg_info_ptr message;
};

/**
 * In-process network connecting consensus instances by validator address.
 * Messages are delivered by posting them onto the receiver's strand, never inline.
 * A filter may drop envelopes to simulate partitions and message loss.
 */
class local_bus : public std::enable_shared_from_this<local_bus> {
public:
  using filter_type = std::function<bool(const envelope&)>;

  /// \brief returns a transport sending on behalf of \p address
  std::shared_ptr<transport> endpoint(const Bytes& address);

  void attach(const Bytes& address, std::weak_ptr<consensus_state> cs);
  void detach(const Bytes& address);

  /// \brief installs a filter; envelopes for which it returns false are dropped
  void set_filter(filter_type f);

  /// \brief delivers \p mi to a single peer
  void deliver(const Bytes& from, const Bytes& to, msg_info_ptr mi);

  /// \brief delivers \p mi to every attached peer except the sender
  void broadcast(const Bytes& from, msg_info_ptr mi);

  size_t dropped() const;

private:
  void transmit(const envelope& env, const std::shared_ptr<consensus_state>& cs);

  mutable std::shared_mutex mtx;
  std::map<Bytes, std::weak_ptr<consensus_state>> peers;
  filter_type filter;
  size_t dropped_{0};
};

} // namespace hybrid::consensus
