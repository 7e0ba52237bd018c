// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/proposal.h>
#include <hybrid/consensus/validator.h>
#include <memory>

namespace hybrid::consensus {

/*
 * Defines the internal consensus state.
 * NOTE: not thread safe
 */
struct round_state {
  int64_t height{};
  int32_t round{};
  round_step_type step{round_step_type::NewHeight};
  tstamp start_time{};

  // Subjective time when +2/3 precommits for Block at Round were found
  tstamp commit_time{};
  std::shared_ptr<const validator_set> validators;
  std::shared_ptr<const proposal> proposal_msg;
  std::shared_ptr<const block> proposal_block;
  int32_t locked_round{-1};
  std::shared_ptr<const block> locked_block;

  // Last known round with POL for non-nil valid block.
  int32_t valid_round{-1};
  std::shared_ptr<const block> valid_block; // Last known block of POL mentioned above.

  int32_t commit_round{-1};
  std::shared_ptr<const validator_set> last_validators;
};

} // namespace hybrid::consensus
