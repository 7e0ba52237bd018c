// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/file.h>
#include <hybrid/common/hex.h>
#include <hybrid/consensus/state_store.h>
#include <hybrid/log/log.h>
#include <google/protobuf/util/json_util.h>

namespace hybrid::consensus {

Result<std::optional<::hybrid::store::State>> state_store::load_proto() const {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    if (ec) {
      return Error::format("unable to access {}: {}", file.string(), ec.message());
    }
    return std::optional<::hybrid::store::State>{};
  }
  auto json = read_file(file);
  if (!json) {
    return json.error();
  }
  ::hybrid::store::State pb;
  if (auto status = google::protobuf::util::JsonStringToMessage(json.value(), &pb); !status.ok()) {
    return Error::format("corrupted state file {}: {}", file.string(), status.ToString());
  }
  return std::optional<::hybrid::store::State>{std::move(pb)};
}

Result<std::optional<state>> state_store::load() const {
  auto pb = load_proto();
  if (!pb) {
    return pb.error();
  }
  if (!pb.value()) {
    return std::optional<state>{};
  }
  auto s = state::from_proto(*pb.value());
  if (!s) {
    return Error::format("corrupted state file {}: {}", file.string(), s.error().message());
  }
  return std::optional<state>{std::move(s.value())};
}

Result<std::optional<decided_block>> state_store::load_decided() const {
  auto pb = load_proto();
  if (!pb) {
    return pb.error();
  }
  if (!pb.value() || !pb.value()->has_decided()) {
    return std::optional<decided_block>{};
  }
  const auto& d = pb.value()->decided();
  decided_block ret{d.height(), d.round(), {d.block_id().begin(), d.block_id().end()}, block::from_proto(d.block())};
  if (ret.height != pb.value()->last_block_height() + 1 || ret.block_.height != ret.height) {
    return Error::format("corrupted state file {}: decided block at unexpected height {}", file.string(), ret.height);
  }
  if (!ret.block_.hashes_to(ret.block_id)) {
    return Error::format("corrupted state file {}: decided block does not match {}", file.string(),
      to_hex(ret.block_id));
  }
  return std::optional<decided_block>{std::move(ret)};
}

Result<void> state_store::save(const state& s, const std::optional<decided_block>& decided) {
  auto pb = s.to_proto();
  if (decided) {
    auto* d = pb.mutable_decided();
    d->set_height(decided->height);
    d->set_round(decided->round);
    d->set_block_id({decided->block_id.begin(), decided->block_id.end()});
    *d->mutable_block() = decided->block_.to_proto();
  }
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  if (auto status = google::protobuf::util::MessageToJsonString(pb, &json, options); !status.ok()) {
    return Error::format("unable to encode state: {}", status.ToString());
  }
  if (auto ok = write_file_atomic(file, json); !ok) {
    return ok.error();
  }
  dlog("saved state: height={} decided={} file={}", s.last_block_height, decided ? decided->height : 0,
    file.string());
  return success();
}

} // namespace hybrid::consensus
