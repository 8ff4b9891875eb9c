/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/proofs_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fcp::proofs, ProofsError, e) {
  using fcp::proofs::ProofsError;
  switch (e) {
    case ProofsError::kNoSuchSealProof:
      return "ProofEngine: seal proof type has no native counterpart";
    case ProofsError::kNoSuchPostProof:
      return "ProofEngine: PoSt proof type has no native counterpart";
    case ProofsError::kInvalidPostProof:
      return "ProofEngine: native PoSt proof type is unknown";
    case ProofsError::kUnclassifiedError:
      return "ProofEngine: unclassified native error";
    case ProofsError::kCallerError:
      return "ProofEngine: native call rejected its arguments";
    case ProofsError::kReceiverError:
      return "ProofEngine: native library failed";
    case ProofsError::kNoSuchAggregationSealProof:
      return "ProofEngine: aggregation proof type has no native counterpart";
    case ProofsError::kUnknown:
      break;
  }
  return "ProofEngine: unknown error";
}
