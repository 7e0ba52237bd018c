// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/consensus/block.h>
#include <hybrid/consensus/canonical.h>
#include <hybrid/consensus/crypto.h>
#include <hybrid/crypto/sha256.h>

namespace hybrid::consensus {

Bytes block::get_hash() const {
  return crypto::Sha256()(BytesView{encode_deterministic(to_proto())});
}

size_t block::byte_size() const {
  return to_proto().ByteSizeLong();
}

Result<void> block::validate_basic() const {
  if (height <= 0) {
    return Error::format("invalid block height {}", height);
  }
  if (time <= 0) {
    return Error::format("invalid block time {}", time);
  }
  if (proposer_address.size() != address_size) {
    return Error::format("invalid proposer address size {}", proposer_address.size());
  }
  if (!last_block_id.empty() && last_block_id.size() != 32) {
    return Error::format("invalid last block id size {}", last_block_id.size());
  }
  return success();
}

::hybrid::types::Block block::to_proto() const {
  ::hybrid::types::Block pb;
  pb.set_height(height);
  pb.set_time(time);
  pb.set_last_block_id({last_block_id.begin(), last_block_id.end()});
  pb.set_proposer_address({proposer_address.begin(), proposer_address.end()});
  for (const auto& tx : txs) {
    pb.add_txs({tx.begin(), tx.end()});
  }
  return pb;
}

block block::from_proto(const ::hybrid::types::Block& pb) {
  block ret;
  ret.height = pb.height();
  ret.time = pb.time();
  ret.last_block_id = {pb.last_block_id().begin(), pb.last_block_id().end()};
  ret.proposer_address = {pb.proposer_address().begin(), pb.proposer_address().end()};
  for (const auto& tx : pb.txs()) {
    ret.txs.emplace_back(tx.begin(), tx.end());
  }
  return ret;
}

} // namespace hybrid::consensus
