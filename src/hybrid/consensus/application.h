// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/block.h>
#include <hybrid/consensus/validator.h>

namespace hybrid::consensus {

/// \brief collaborator which supplies block payloads and receives finalized blocks
class application {
public:
  virtual ~application() = default;

  /// \brief returns transactions for a fresh block proposed by this node
  virtual std::vector<Bytes> create_txs(int64_t height, int64_t max_bytes) = 0;

  /// \brief application-level checks on a proposed block
  virtual Result<void> validate_block(const block& b) {
    return success();
  }

  /// \brief called exactly once per height, in increasing height order, with the finalized block
  ///
  /// On error, the height is not considered applied and the commit is attempted again in a later round.
  /// \return changes to the validator set, effective from the next height
  virtual Result<std::vector<validator_update>> on_commit(int64_t height, const Bytes& block_id, const block& b) = 0;
};

} // namespace hybrid::consensus
