// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace hybrid {

/// \brief microseconds since unix epoch
using tstamp = int64_t;

tstamp get_time();

} // namespace hybrid
