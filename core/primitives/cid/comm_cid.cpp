/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/cid/comm_cid.hpp"

namespace fcp::primitives::cid {
  using libp2p::multi::HashType;
  using libp2p::multi::Multihash;

  namespace {
    struct CommitmentFormat {
      CID::Multicodec codec;
      HashType hash;
    };

    CommitmentFormat formatOf(CommitmentKind kind) {
      if (kind == CommitmentKind::kSealed) {
        return {CID::Multicodec::FILECOIN_COMMITMENT_SEALED,
                HashType::poseidon_bls12_381_a1_fc1};
      }
      return {CID::Multicodec::FILECOIN_COMMITMENT_UNSEALED,
              HashType::sha2_256_trunc254_padded};
    }
  }  // namespace

  outcome::result<CID> commitmentToCid(CommitmentKind kind, BytesIn comm) {
    if (static_cast<size_t>(comm.size()) != kCommitmentBytesLen) {
      return CommitmentError::kWrongSize;
    }
    const auto format{formatOf(kind)};
    OUTCOME_TRY(multihash, Multihash::create(format.hash, comm));
    return CID{CID::Version::V1, format.codec, std::move(multihash)};
  }

  outcome::result<Comm> cidToCommitment(CommitmentKind kind, const CID &cid) {
    const auto format{formatOf(kind)};
    if (cid.content_type != format.codec) {
      return CommitmentError::kWrongCodec;
    }
    if (cid.content_address.getType() != format.hash) {
      return CommitmentError::kWrongHash;
    }
    const auto hash{cid.content_address.getHash()};
    if (static_cast<size_t>(hash.size()) != kCommitmentBytesLen) {
      return CommitmentError::kWrongSize;
    }
    return Comm::fromSpan(hash);
  }
}  // namespace fcp::primitives::cid

OUTCOME_CPP_DEFINE_CATEGORY(fcp::primitives::cid, CommitmentError, e) {
  using fcp::primitives::cid::CommitmentError;

  switch (e) {
    case CommitmentError::kWrongCodec:
      return "Commitment: unexpected CID codec";
    case CommitmentError::kWrongHash:
      return "Commitment: unexpected multihash function";
    case CommitmentError::kWrongSize:
      return "Commitment: commitments must be 32 bytes long";
  }
  return "Commitment: unknown error";
}
