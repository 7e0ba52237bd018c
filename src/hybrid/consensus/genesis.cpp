// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/file.h>
#include <hybrid/common/hex.h>
#include <hybrid/consensus/genesis.h>
#include <hybrid/store/state.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <set>

namespace hybrid::consensus {

using google::protobuf::util::TimeUtil;

Result<genesis_doc> genesis_doc::genesis_doc_from_json(const std::string& json) {
  ::hybrid::store::GenesisDoc pb;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &pb); !status.ok()) {
    return Error::format("unable to parse genesis: {}", status.ToString());
  }

  genesis_doc doc;
  doc.genesis_time = TimeUtil::TimestampToMicroseconds(pb.genesis_time());
  doc.chain_id = pb.chain_id();
  doc.initial_height = pb.initial_height();
  for (const auto& v : pb.validators()) {
    doc.validators.push_back(genesis_validator{{v.address().begin(), v.address().end()},
      {{v.pub_key().begin(), v.pub_key().end()}}, v.voting_power(), v.name()});
  }
  if (auto ok = doc.complete(); !ok) {
    return ok.error();
  }
  return doc;
}

Result<genesis_doc> genesis_doc::genesis_doc_from_file(const std::filesystem::path& gen_doc_file) {
  auto json = read_file(gen_doc_file);
  if (!json) {
    return Error::format("couldn't read genesis doc file: {}", json.error().message());
  }
  return genesis_doc_from_json(json.value());
}

Result<std::string> genesis_doc::to_json() const {
  ::hybrid::store::GenesisDoc pb;
  *pb.mutable_genesis_time() = TimeUtil::MicrosecondsToTimestamp(genesis_time);
  pb.set_chain_id(chain_id);
  pb.set_initial_height(initial_height);
  for (const auto& v : validators) {
    auto val = pb.add_validators();
    val->set_address({v.address.begin(), v.address.end()});
    val->set_pub_key({v.pub_key_.key.begin(), v.pub_key_.key.end()});
    val->set_voting_power(v.power);
    val->set_name(v.name);
  }
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  if (auto status = google::protobuf::util::MessageToJsonString(pb, &json, options); !status.ok()) {
    return Error::format("unable to encode genesis: {}", status.ToString());
  }
  return json;
}

Result<void> genesis_doc::save(const std::filesystem::path& file_path) const {
  auto json = to_json();
  if (!json) {
    return json.error();
  }
  return write_file_atomic(file_path, json.value());
}

Result<void> genesis_doc::validate_and_complete() const {
  if (chain_id.empty()) {
    return Error("genesis doc must include non-empty chain_id");
  }
  if (chain_id.size() > max_chain_id_len) {
    return Error::format("chain_id in genesis doc is too long (max={})", max_chain_id_len);
  }
  if (initial_height < 1) {
    return Error::format("initial_height cannot be less than 1, got {}", initial_height);
  }
  if (validators.empty()) {
    return Error("genesis doc must include at least one validator");
  }
  std::set<Bytes> addresses;
  for (auto i = 0u; i < validators.size(); i++) {
    const auto& v = validators[i];
    if (v.power <= 0) {
      return Error::format("genesis file cannot contain validators with non-positive voting power: {}", v.power);
    }
    if (v.pub_key_.key.size() != 32) {
      return Error::format("genesis validator {} has an invalid public key", i);
    }
    if (v.address != v.pub_key_.address()) {
      return Error::format("incorrect address for validator {} in the genesis file, should be {}", i,
        to_hex(v.pub_key_.address()));
    }
    if (!addresses.insert(v.address).second) {
      return Error::format("duplicate validator {} in the genesis file", to_hex(v.address));
    }
  }
  return success();
}

Result<void> genesis_doc::complete() {
  if (initial_height == 0) {
    initial_height = 1;
  }
  for (auto& v : validators) {
    if (v.address.empty() && v.pub_key_.key.size() == 32) {
      v.address = v.pub_key_.address();
    }
  }
  return validate_and_complete();
}

} // namespace hybrid::consensus
