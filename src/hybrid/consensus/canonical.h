// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/proposal.h>
#include <hybrid/consensus/vote.h>
#include <google/protobuf/message_lite.h>
#include <string>

namespace hybrid::consensus {

/// \brief serializes a message with deterministic field ordering
Bytes encode_deterministic(const google::protobuf::MessageLite& msg);

/// \brief canonical sign bytes of votes and proposals
///
/// Every node must derive identical bytes for logically identical messages.
/// Signatures are excluded; the chain id is bound in so signatures cannot be replayed on another chain.
struct canonical {
  static ::hybrid::types::CanonicalVote canonicalize_vote(const std::string& chain_id, const vote& v);
  static ::hybrid::types::CanonicalProposal canonicalize_proposal(const std::string& chain_id, const proposal& p);

  static Bytes vote_sign_bytes(const std::string& chain_id, const vote& v);
  static Bytes proposal_sign_bytes(const std::string& chain_id, const proposal& p);
};

} // namespace hybrid::consensus
