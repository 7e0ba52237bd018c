// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/block.h>
#include <memory>

namespace hybrid::consensus {

/**
 * Proposal defines a block proposal for the consensus.
 * It refers to the block by block_id and carries the block itself.
 * It must be signed by the correct proposer for the given height/round to be considered valid.
 * It may depend on votes from a previous round, a so-called proof-of-lock (POL) round, as noted in pol_round.
 * If pol_round >= 0, then block_id corresponds to the block that is locked in pol_round.
 */
struct proposal {
  int64_t height{};
  int32_t round{};
  int32_t pol_round{-1};
  Bytes block_id;
  tstamp timestamp{};
  Bytes proposer_address;
  Bytes signature;
  std::shared_ptr<const block> block_;

  static proposal new_proposal(
    int64_t height_, int32_t round_, int32_t pol_round_, std::shared_ptr<const block> b, Bytes proposer) {
    auto id = b->get_hash();
    return proposal{height_, round_, pol_round_, std::move(id), get_time(), std::move(proposer), {}, std::move(b)};
  }
};

} // namespace hybrid::consensus
