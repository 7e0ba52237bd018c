// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/common/bytes.h>
#include <string>
#include <string_view>

namespace hybrid {

/// \addtogroup common
/// \{

/// \brief converts bytes to hex string
/// \param s sequence of bytes
std::string to_hex(BytesView s);

/// \brief converts hex string to bytes
/// \param s hex string
/// \throw std::invalid_argument on a malformed hex string
Bytes from_hex(std::string_view s);

/// \}

} // namespace hybrid
