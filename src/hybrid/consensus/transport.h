// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/proposal.h>
#include <hybrid/consensus/vote.h>
#include <memory>
#include <string>
#include <variant>

namespace hybrid::consensus {

/// \brief inbound consensus message with the id of the peer it came from (empty for our own)
/// \brief asks peers for the block decided at \p height and the precommits deciding it
struct commit_request {
  int64_t height{};
};

struct msg_info {
  std::variant<proposal, vote, commit_request> msg;
  std::string peer_id;
};

using msg_info_ptr = std::shared_ptr<msg_info>;

/// \brief outbound side of the message bus between validators
class transport {
public:
  virtual ~transport() = default;

  virtual void broadcast_proposal(const proposal& p) = 0;
  virtual void broadcast_vote(const vote& v) = 0;
  virtual void broadcast_commit_request(const commit_request& r) = 0;
};

} // namespace hybrid::consensus
