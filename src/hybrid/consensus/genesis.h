// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/crypto.h>
#include <hybrid/common/time.h>
#include <hybrid/core/result.h>
#include <filesystem>
#include <vector>

namespace hybrid::consensus {

constexpr size_t max_chain_id_len{50};

struct genesis_validator {
  Bytes address;
  ::hybrid::consensus::pub_key pub_key_;
  int64_t power;
  std::string name;
};

struct genesis_doc {
  tstamp genesis_time{};
  std::string chain_id;
  int64_t initial_height{1};
  std::vector<genesis_validator> validators;

  static Result<genesis_doc> genesis_doc_from_file(const std::filesystem::path& gen_doc_file);
  static Result<genesis_doc> genesis_doc_from_json(const std::string& json);

  Result<std::string> to_json() const;
  Result<void> save(const std::filesystem::path& file_path) const;

  /// \brief checks the document
  Result<void> validate_and_complete() const;

  /// \brief fills in missing addresses and initial height, then validates
  Result<void> complete();
};

} // namespace hybrid::consensus
