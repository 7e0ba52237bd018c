// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <string>

namespace hybrid::thread {

/// \brief name of the calling thread, as shown in log lines
///
/// Threads never named by set_thread_name() report their OS name, or `thread-<n>`.
const std::string& thread_name();

/// \brief names the calling thread; the OS name is truncated to 15 characters
void set_thread_name(const std::string& name);

} // namespace hybrid::thread
