// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/core/error.h>

namespace hybrid::consensus {

extern const Error err_invalid_signature;
extern const Error err_unknown_validator;
extern const Error err_stale_height;
extern const Error err_future_height;
extern const Error err_invalid_vote_type;
extern const Error err_round_too_far;

} // namespace hybrid::consensus
