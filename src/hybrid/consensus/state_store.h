// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/state.h>
#include <filesystem>
#include <optional>

namespace hybrid::consensus {

/// block decided at the next height, saved before the application sees it
struct decided_block {
  int64_t height{};
  int32_t round{};
  Bytes block_id;
  block block_;
};

/**
 * Durable record of the last committed height, its block id and the validator set for the next height.
 * A decided block of the next height may be saved along with the state, so a crash between deciding a block
 * and applying it replays the same block. The file is replaced atomically on every save.
 */
class state_store {
public:
  explicit state_store(std::filesystem::path file): file(std::move(file)) {}

  /// \brief loads the saved state
  /// \return nullopt if nothing was saved yet, error if the file is unreadable or corrupt
  Result<std::optional<state>> load() const;

  /// \brief loads the block decided on top of the saved state
  /// \return nullopt if the saved state has no pending decision
  Result<std::optional<decided_block>> load_decided() const;

  /// \brief replaces the saved state; a decided block is kept only if \p decided is given
  Result<void> save(const state& s, const std::optional<decided_block>& decided = std::nullopt);

  const std::filesystem::path& path() const {
    return file;
  }

private:
  Result<std::optional<::hybrid::store::State>> load_proto() const;

  std::filesystem::path file;
};

} // namespace hybrid::consensus
