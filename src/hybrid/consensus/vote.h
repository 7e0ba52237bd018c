// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/types.h>

namespace hybrid::consensus {

/**
 * Vote represents a prevote or precommit from a validator.
 * An empty block_id stands for a vote for nil.
 */
struct vote {
  signed_msg_type type{Unknown};
  int64_t height{};
  int32_t round{};
  Bytes block_id;
  tstamp timestamp{};
  Bytes validator_address;
  Bytes signature;

  bool is_nil() const {
    return block_id.empty();
  }
};

} // namespace hybrid::consensus
