// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <spdlog/spdlog.h>

// Logging macros over the default spdlog logger. Arguments follow fmt format strings, and the
// source location is recorded for the `file:line` column installed by hybrid::log::setup().
#define dlog(FORMAT, ...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define ilog(FORMAT, ...) SPDLOG_LOGGER_INFO(spdlog::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define wlog(FORMAT, ...) SPDLOG_LOGGER_WARN(spdlog::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define elog(FORMAT, ...) SPDLOG_LOGGER_ERROR(spdlog::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
