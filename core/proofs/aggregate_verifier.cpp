/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/aggregate_verifier.hpp"

#include "proofs/proofs_error.hpp"

namespace fcp::proofs {
  namespace {
    /// Native library reports unparsable or corrupted proofs as these
    bool isRejection(const std::error_code &error) {
      return error == ProofsError::kUnclassifiedError
             || error == ProofsError::kReceiverError;
    }
  }  // namespace

  AggregateVerifier::AggregateVerifier(std::shared_ptr<ProofEngine> proofs)
      : proofs_{std::move(proofs)} {}

  outcome::result<void> AggregateVerifier::verifyAggregateSeals(
      const AggregateSealVerifyProofAndInfos &aggregate) const {
    if (aggregate.infos.empty() || aggregate.proof.empty()
        || aggregate.seal_proof == RegisteredSealProof::kUndefined) {
      return AggregateVerifierError::kVerificationFault;
    }
    const auto valid{proofs_->verifyAggregateSeals(aggregate)};
    if (!valid) {
      if (isRejection(valid.error())) {
        return AggregateVerifierError::kVerificationFailure;
      }
      return AggregateVerifierError::kVerificationFault;
    }
    if (!valid.value()) {
      return AggregateVerifierError::kVerificationFailure;
    }
    return outcome::success();
  }
}  // namespace fcp::proofs

OUTCOME_CPP_DEFINE_CATEGORY(fcp::proofs, AggregateVerifierError, e) {
  using fcp::proofs::AggregateVerifierError;
  switch (e) {
    case AggregateVerifierError::kVerificationFailure:
      return "AggregateVerifier: aggregate seal proof is invalid";
    case AggregateVerifierError::kVerificationFault:
      return "AggregateVerifier: aggregate seal proof cannot be verified";
  }
  return "AggregateVerifier: unknown error";
}
