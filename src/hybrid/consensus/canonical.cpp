// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/consensus/canonical.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

namespace hybrid::consensus {

Bytes encode_deterministic(const google::protobuf::MessageLite& msg) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream sos(&out);
    google::protobuf::io::CodedOutputStream cos(&sos);
    cos.SetSerializationDeterministic(true);
    msg.SerializeToCodedStream(&cos);
  }
  return {out.begin(), out.end()};
}

::hybrid::types::CanonicalVote canonical::canonicalize_vote(const std::string& chain_id, const vote& v) {
  ::hybrid::types::CanonicalVote ret;
  ret.set_type(static_cast<::hybrid::types::SignedMsgType>(v.type));
  ret.set_height(v.height);
  ret.set_round(v.round);
  ret.set_block_id({v.block_id.begin(), v.block_id.end()});
  ret.set_timestamp(v.timestamp);
  ret.set_chain_id(chain_id);
  ret.set_validator_address({v.validator_address.begin(), v.validator_address.end()});
  return ret;
}

::hybrid::types::CanonicalProposal canonical::canonicalize_proposal(const std::string& chain_id, const proposal& p) {
  ::hybrid::types::CanonicalProposal ret;
  ret.set_type(::hybrid::types::SIGNED_MSG_TYPE_PROPOSAL);
  ret.set_height(p.height);
  ret.set_round(p.round);
  ret.set_pol_round(p.pol_round);
  ret.set_block_id({p.block_id.begin(), p.block_id.end()});
  ret.set_timestamp(p.timestamp);
  ret.set_chain_id(chain_id);
  ret.set_proposer_address({p.proposer_address.begin(), p.proposer_address.end()});
  return ret;
}

Bytes canonical::vote_sign_bytes(const std::string& chain_id, const vote& v) {
  return encode_deterministic(canonicalize_vote(chain_id, v));
}

Bytes canonical::proposal_sign_bytes(const std::string& chain_id, const proposal& p) {
  return encode_deterministic(canonicalize_proposal(chain_id, p));
}

} // namespace hybrid::consensus
