// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/file.h>
#include <hybrid/consensus/canonical.h>
#include <hybrid/consensus/signer.h>
#include <hybrid/log/log.h>
#include <hybrid/store/state.pb.h>
#include <google/protobuf/util/json_util.h>
#include <algorithm>
#include <mutex>
#include <type_traits>

namespace hybrid::consensus {

Result<void> signer::sign_vote(const std::string& chain_id, vote& v) {
  auto sig = sign(canonical::vote_sign_bytes(chain_id, v));
  if (!sig) {
    return sig.error();
  }
  v.signature = std::move(sig.value());
  return success();
}

Result<void> signer::sign_proposal(const std::string& chain_id, proposal& p) {
  auto sig = sign(canonical::proposal_sign_bytes(chain_id, p));
  if (!sig) {
    return sig.error();
  }
  p.signature = std::move(sig.value());
  return success();
}

ed25519_signer::ed25519_signer(std::optional<priv_key> key): key_(std::move(key)) {
  if (key_) {
    auto pk = key_->get_pub_key();
    address_ = pk.address();
    keys_[address_] = pk;
  }
}

Bytes ed25519_signer::address() const {
  return address_;
}

Result<Bytes> ed25519_signer::sign(BytesView msg) {
  if (!key_) {
    return Error("signer has no private key");
  }
  return key_->sign(msg);
}

bool ed25519_signer::verify(const Bytes& address, BytesView msg, BytesView sig) const {
  std::shared_lock g(mtx_);
  auto it = keys_.find(address);
  if (it == keys_.end())
    return false;
  return it->second.verify_signature(msg, sig);
}

void ed25519_signer::register_validators(const validator_set& vals) {
  std::unique_lock g(mtx_);
  for (const auto& val : vals.validators) {
    if (!val.pub_key_.empty())
      keys_[val.address] = val.pub_key_;
  }
}

Result<bool> last_sign_state::check_hrs(int64_t height_, int32_t round_, sign_step step_) const {
  if (height > height_) {
    return Error::format("height regression. Got {}, last height {}", height_, height);
  }
  if (height == height_) {
    if (round > round_) {
      return Error::format("round regression at height {}. Got {}, last round {}", height_, round_, round);
    }
    if (round == round_) {
      if (step > step_) {
        return Error::format("step regression at height {} round {}. Got {}, last step {}", height_, round_,
          static_cast<int>(step_), static_cast<int>(step));
      }
      if (step == step_) {
        if (signbytes.empty() || signature.empty()) {
          return Error::format("no signature saved for height {} round {}", height_, round_);
        }
        return true;
      }
    }
  }
  return false;
}

Result<last_sign_state> last_sign_state::load(const std::filesystem::path& file) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    if (ec) {
      return Error::format("unable to access {}: {}", file.string(), ec.message());
    }
    return last_sign_state{};
  }
  auto json = read_file(file);
  if (!json) {
    return json.error();
  }
  ::hybrid::store::PrivValidatorState pb;
  if (auto status = google::protobuf::util::JsonStringToMessage(json.value(), &pb); !status.ok()) {
    return Error::format("unable to parse {}: {}", file.string(), status.ToString());
  }
  if (pb.step() < static_cast<int>(sign_step::none) || pb.step() > static_cast<int>(sign_step::precommit)) {
    return Error::format("{}: invalid sign step {}", file.string(), pb.step());
  }
  return last_sign_state{pb.height(), pb.round(), static_cast<sign_step>(pb.step()),
    {pb.signbytes().begin(), pb.signbytes().end()}, {pb.signature().begin(), pb.signature().end()}};
}

Result<void> last_sign_state::save(const std::filesystem::path& file) const {
  ::hybrid::store::PrivValidatorState pb;
  pb.set_height(height);
  pb.set_round(round);
  pb.set_step(static_cast<int>(step));
  pb.set_signbytes({signbytes.begin(), signbytes.end()});
  pb.set_signature({signature.begin(), signature.end()});
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  if (auto status = google::protobuf::util::MessageToJsonString(pb, &json, options); !status.ok()) {
    return Error::format("unable to encode sign state: {}", status.ToString());
  }
  return write_file_atomic(file, json);
}

namespace {

  sign_step vote_to_step(const vote& v) {
    switch (v.type) {
    case Prevote:
      return sign_step::prevote;
    case Precommit:
      return sign_step::precommit;
    default:
      return sign_step::none;
    }
  }

  Bytes sign_bytes_of(const std::string& chain_id, const vote& v) {
    return canonical::vote_sign_bytes(chain_id, v);
  }

  Bytes sign_bytes_of(const std::string& chain_id, const proposal& p) {
    return canonical::proposal_sign_bytes(chain_id, p);
  }

  /// returns the timestamp of \p last_sign_bytes if \p obj differs from it only by its timestamp
  template<typename T>
  std::optional<tstamp> only_differ_by_timestamp(
    const std::string& chain_id, const T& obj, BytesView last_sign_bytes) {
    tstamp last_timestamp{};
    if constexpr (std::is_same_v<T, vote>) {
      ::hybrid::types::CanonicalVote last;
      if (!last.ParseFromArray(last_sign_bytes.data(), static_cast<int>(last_sign_bytes.size())))
        return {};
      last_timestamp = last.timestamp();
    } else {
      ::hybrid::types::CanonicalProposal last;
      if (!last.ParseFromArray(last_sign_bytes.data(), static_cast<int>(last_sign_bytes.size())))
        return {};
      last_timestamp = last.timestamp();
    }
    auto copy = obj;
    copy.timestamp = last_timestamp;
    auto bytes = sign_bytes_of(chain_id, copy);
    if (!std::equal(bytes.begin(), bytes.end(), last_sign_bytes.begin(), last_sign_bytes.end()))
      return {};
    return last_timestamp;
  }

} // namespace

Result<std::shared_ptr<file_signer>> file_signer::load(priv_key key, std::filesystem::path state_file) {
  auto lss = last_sign_state::load(state_file);
  if (!lss) {
    return lss.error();
  }
  return std::make_shared<file_signer>(std::move(key), std::move(state_file), std::move(lss.value()));
}

Result<void> file_signer::sign_vote(const std::string& chain_id, vote& v) {
  auto step = vote_to_step(v);
  if (step == sign_step::none) {
    return Error::format("unable to sign vote of type {}", static_cast<int>(v.type));
  }
  return sign_internal(chain_id, v, step);
}

Result<void> file_signer::sign_proposal(const std::string& chain_id, proposal& p) {
  return sign_internal(chain_id, p, sign_step::propose);
}

last_sign_state file_signer::get_last_sign_state() const {
  std::scoped_lock g(mtx);
  return lss;
}

template<typename T>
Result<void> file_signer::sign_internal(const std::string& chain_id, T& obj, sign_step step) {
  std::scoped_lock g(mtx);
  auto same_hrs = lss.check_hrs(obj.height, obj.round, step);
  if (!same_hrs) {
    return same_hrs.error();
  }

  auto sign_bytes = sign_bytes_of(chain_id, obj);

  // We might have crashed before the last signature got out, so the same HRS is signed again.
  // If the sign bytes are the same, use the last signature.
  // If they only differ by timestamp, use the last timestamp and signature.
  if (same_hrs.value()) {
    if (sign_bytes == lss.signbytes) {
      obj.signature = lss.signature;
      return success();
    }
    if (auto timestamp = only_differ_by_timestamp(chain_id, obj, lss.signbytes); timestamp) {
      obj.timestamp = *timestamp;
      obj.signature = lss.signature;
      return success();
    }
    return Error::format("conflicting data at height {} round {} step {}", obj.height, obj.round,
      static_cast<int>(step));
  }

  auto sig = sign(sign_bytes);
  if (!sig) {
    return sig.error();
  }
  auto next = last_sign_state{obj.height, obj.round, step, std::move(sign_bytes), sig.value()};
  if (auto ok = next.save(state_file); !ok) {
    elog("failed to save sign state: file={} err={}", state_file.string(), ok.error().message());
    return ok.error();
  }
  lss = std::move(next);
  obj.signature = std::move(sig.value());
  return success();
}

priv_validator_key priv_validator_key::gen_priv_key() {
  auto priv = priv_key::new_priv_key();
  auto pub = priv.get_pub_key();
  return {pub.address(), pub, priv};
}

Result<priv_validator_key> priv_validator_key::load(const std::filesystem::path& file) {
  auto json = read_file(file);
  if (!json) {
    return json.error();
  }
  ::hybrid::store::PrivValidatorKey pb;
  if (auto status = google::protobuf::util::JsonStringToMessage(json.value(), &pb); !status.ok()) {
    return Error::format("unable to parse {}: {}", file.string(), status.ToString());
  }
  priv_validator_key ret{{pb.address().begin(), pb.address().end()}, {{pb.pub_key().begin(), pb.pub_key().end()}},
    {{pb.priv_key().begin(), pb.priv_key().end()}}};
  if (ret.priv_key_.key.size() != 64 || ret.priv_key_.get_pub_key() != ret.pub_key_) {
    return Error::format("{}: private key does not match public key", file.string());
  }
  if (ret.pub_key_.address() != ret.address) {
    return Error::format("{}: address does not match public key", file.string());
  }
  return ret;
}

Result<void> priv_validator_key::save(const std::filesystem::path& file) const {
  ::hybrid::store::PrivValidatorKey pb;
  pb.set_address({address.begin(), address.end()});
  pb.set_pub_key({pub_key_.key.begin(), pub_key_.key.end()});
  pb.set_priv_key({priv_key_.key.begin(), priv_key_.key.end()});
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  if (auto status = google::protobuf::util::MessageToJsonString(pb, &json, options); !status.ok()) {
    return Error::format("unable to encode validator key: {}", status.ToString());
  }
  return write_file_atomic(file, json);
}

} // namespace hybrid::consensus
