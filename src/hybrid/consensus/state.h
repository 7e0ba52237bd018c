// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/block.h>
#include <hybrid/consensus/genesis.h>
#include <hybrid/consensus/validator.h>
#include <hybrid/store/state.pb.h>
#include <memory>

namespace hybrid::consensus {

/**
 * State is a short description of the latest committed block.
 * It keeps all information necessary to validate new blocks, including the validator set for the next height.
 */
struct state {
  std::string chain_id;
  int64_t initial_height{1};

  int64_t last_block_height{0}; // set to 0 at genesis
  Bytes last_block_id;
  tstamp last_block_time{};

  std::shared_ptr<const validator_set> validators{}; // effective for last_block_height + 1
  std::shared_ptr<const validator_set> last_validators{};

  static Result<state> make_genesis_state(const genesis_doc& gen_doc);

  bool is_empty() const {
    return validators == nullptr;
  }

  /// \brief height the next block is expected at
  int64_t next_height() const {
    return last_block_height == 0 ? initial_height : last_block_height + 1;
  }

  /// \brief builds a block on top of this state
  block make_block(int64_t height, std::vector<Bytes> txs, const Bytes& proposer_address, tstamp now) const;

  /// \brief checks that \p b extends this state
  Result<void> validate_block(const block& b) const;

  /// \brief returns the state after committing \p b with the given validator changes
  Result<state> apply_block(const Bytes& block_id, const block& b, const std::vector<validator_update>& updates) const;

  ::hybrid::store::State to_proto() const;
  static Result<state> from_proto(const ::hybrid::store::State& pb);
};

} // namespace hybrid::consensus
