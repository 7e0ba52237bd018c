// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/core/result.h>
#include <filesystem>
#include <string>
#include <string_view>

namespace hybrid {

/// \brief reads the whole file into a string
Result<std::string> read_file(const std::filesystem::path& path);

/// \brief replaces file contents atomically
///
/// Contents are written to a sibling temporary file, flushed to disk and renamed over \p path,
/// so readers observe either the old or the new contents, never a partial write.
/// The parent directory is synced after the rename.
Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view contents);

} // namespace hybrid
