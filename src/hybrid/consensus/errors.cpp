// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/consensus/errors.h>

namespace hybrid::consensus {

const Error err_invalid_signature = Error("invalid signature");
const Error err_unknown_validator = Error("unknown validator");
const Error err_stale_height = Error("vote for a stale height");
const Error err_future_height = Error("vote for a future height");
const Error err_invalid_vote_type = Error("invalid vote type");
const Error err_round_too_far = Error("vote round too far ahead");

} // namespace hybrid::consensus
