// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/common/bytes.h>
#include <hybrid/common/time.h>
#include <cstdint>

namespace hybrid::consensus {

enum class round_step_type {
  NewHeight = 1, // Wait til CommitTime + timeoutCommit
  NewRound = 2, // Setup new round and go to Propose
  Propose = 3, // Did propose, gossip proposal
  Prevote = 4, // Did prevote, gossip prevotes
  Precommit = 5, // Did precommit, gossip precommits
  Commit = 6 // Entered commit state machine
};

constexpr auto round_step_to_str(round_step_type step) {
  switch (step) {
  case round_step_type::NewHeight:
    return "NewHeight";
  case round_step_type::NewRound:
    return "NewRound";
  case round_step_type::Propose:
    return "Propose";
  case round_step_type::Prevote:
    return "Prevote";
  case round_step_type::Precommit:
    return "Precommit";
  case round_step_type::Commit:
    return "Commit";
  }
  return "Unknown";
}

enum signed_msg_type : int32_t {
  Unknown = 0,
  Prevote = 1,
  Precommit = 2,
  Proposal = 32
};

constexpr auto signed_msg_type_to_str(signed_msg_type type) {
  switch (type) {
  case Prevote:
    return "prevote";
  case Precommit:
    return "precommit";
  case Proposal:
    return "proposal";
  default:
    return "unknown";
  }
}

} // namespace hybrid::consensus
