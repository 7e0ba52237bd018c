// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <boost/preprocessor/cat.hpp>
#include <nonstd/scope.hpp>

/// \brief runs the given callable when the enclosing scope exits
///
/// The guard's destructor is noexcept: the callable must not throw.
/// \ingroup common
#define hybrid_defer(...) auto BOOST_PP_CAT(_defer_, __COUNTER__) = ::nonstd::make_scope_exit(__VA_ARGS__)
