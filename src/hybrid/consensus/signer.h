// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/proposal.h>
#include <hybrid/consensus/validator.h>
#include <hybrid/consensus/vote.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace hybrid::consensus {

/// \brief signs on behalf of the local validator and verifies signatures of others
class signer {
public:
  virtual ~signer() = default;

  /// \brief address of the local validator; empty if this node does not sign
  virtual Bytes address() const = 0;

  virtual Result<Bytes> sign(BytesView msg) = 0;

  /// \brief signs the canonical bytes of \p v and stores the signature in it
  virtual Result<void> sign_vote(const std::string& chain_id, vote& v);
  virtual Result<void> sign_proposal(const std::string& chain_id, proposal& p);

  /// \brief verifies \p sig over \p msg made by the validator identified by \p address
  virtual bool verify(const Bytes& address, BytesView msg, BytesView sig) const = 0;

  /// \brief makes keys of the given validators known to verify()
  virtual void register_validators(const validator_set& vals) {}
};

/// \brief ed25519 signer backed by libsodium
class ed25519_signer : public signer {
public:
  explicit ed25519_signer(std::optional<priv_key> key = std::nullopt);

  Bytes address() const override;
  Result<Bytes> sign(BytesView msg) override;
  bool verify(const Bytes& address, BytesView msg, BytesView sig) const override;
  void register_validators(const validator_set& vals) override;

private:
  std::optional<priv_key> key_;
  Bytes address_;
  mutable std::shared_mutex mtx_;
  std::map<Bytes, pub_key> keys_;
};

enum class sign_step : int8_t {
  none = 0,
  propose = 1,
  prevote = 2,
  precommit = 3
};

/// \brief last height/round/step signed by a validator (`priv_validator_state.json`)
struct last_sign_state {
  int64_t height{};
  int32_t round{};
  sign_step step{sign_step::none};
  Bytes signbytes;
  Bytes signature;

  /// \brief checks that (height, round, step) does not regress
  /// \return true if it was the last one signed, false if it is newer, error if it regresses
  Result<bool> check_hrs(int64_t height_, int32_t round_, sign_step step_) const;

  /// \brief loads the state; a missing file yields an empty state
  static Result<last_sign_state> load(const std::filesystem::path& file);
  Result<void> save(const std::filesystem::path& file) const;
};

/**
 * ed25519 signer which never signs two different messages for the same height/round/step.
 * The last signed height/round/step is saved to a file before a signature is released,
 * so the guarantee survives restarts.
 */
class file_signer : public ed25519_signer {
public:
  static Result<std::shared_ptr<file_signer>> load(priv_key key, std::filesystem::path state_file);

  Result<void> sign_vote(const std::string& chain_id, vote& v) override;
  Result<void> sign_proposal(const std::string& chain_id, proposal& p) override;

  last_sign_state get_last_sign_state() const;

  file_signer(priv_key key, std::filesystem::path state_file, last_sign_state lss)
    : ed25519_signer(std::move(key)), state_file(std::move(state_file)), lss(std::move(lss)) {}

private:
  template<typename T>
  Result<void> sign_internal(const std::string& chain_id, T& obj, sign_step step);

  std::filesystem::path state_file;
  mutable std::mutex mtx;
  last_sign_state lss;
};

/// \brief validator key file (`priv_validator_key.json`)
struct priv_validator_key {
  Bytes address;
  pub_key pub_key_;
  priv_key priv_key_;

  static priv_validator_key gen_priv_key();

  static Result<priv_validator_key> load(const std::filesystem::path& file);
  Result<void> save(const std::filesystem::path& file) const;
};

} // namespace hybrid::consensus
