/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "primitives/cid/cid.hpp"

namespace fcp::primitives::cid {
  /// Size of CommR and CommD
  constexpr size_t kCommitmentBytesLen = 32;
  using Comm = common::Blob<kCommitmentBytesLen>;

  /**
   * Kind of sector commitment, defines codec and hash function of its CID
   */
  enum class CommitmentKind {
    /// CommR, root of the replica tree
    kSealed,
    /// CommD and CommP, root of the unsealed data tree
    kUnsealed,
  };

  outcome::result<CID> commitmentToCid(CommitmentKind kind, BytesIn comm);

  outcome::result<Comm> cidToCommitment(CommitmentKind kind, const CID &cid);

  inline outcome::result<CID> replicaCommitmentToCid(BytesIn comm_r) {
    return commitmentToCid(CommitmentKind::kSealed, comm_r);
  }

  inline outcome::result<CID> dataCommitmentToCid(BytesIn comm_d) {
    return commitmentToCid(CommitmentKind::kUnsealed, comm_d);
  }

  inline outcome::result<Comm> cidToReplicaCommitment(const CID &cid) {
    return cidToCommitment(CommitmentKind::kSealed, cid);
  }

  inline outcome::result<Comm> cidToDataCommitment(const CID &cid) {
    return cidToCommitment(CommitmentKind::kUnsealed, cid);
  }

  enum class CommitmentError {
    kWrongCodec = 1,
    kWrongHash,
    kWrongSize,
  };
}  // namespace fcp::primitives::cid

OUTCOME_HPP_DECLARE_ERROR(fcp::primitives::cid, CommitmentError);
