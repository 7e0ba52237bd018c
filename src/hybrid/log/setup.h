// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/log/log.h>
#include <string>

namespace hybrid::log {

/// \brief sets global log level from its name (trace, debug, info, warn, error, critical, off)
void set_level(const std::string& level);

/// \brief installs the node log pattern on every logger, with thread name and source location columns
void setup();

} // namespace hybrid::log
