// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/types.h>
#include <hybrid/core/result.h>
#include <hybrid/types/types.pb.h>
#include <vector>

namespace hybrid::consensus {

/**
 * Block is the unit of agreement.
 * Its identifier is the sha256 hash of its deterministic protobuf encoding,
 * which lets a block be checked against a block id received from anyone.
 */
struct block {
  int64_t height{};
  tstamp time{};
  Bytes last_block_id;
  Bytes proposer_address;
  std::vector<Bytes> txs;

  Bytes get_hash() const;

  bool hashes_to(const Bytes& hash) const {
    return !hash.empty() && get_hash() == hash;
  }

  /// \brief size of the encoded block in bytes
  size_t byte_size() const;

  /// \brief performs stateless checks
  Result<void> validate_basic() const;

  ::hybrid::types::Block to_proto() const;
  static block from_proto(const ::hybrid::types::Block& pb);
};

} // namespace hybrid::consensus
