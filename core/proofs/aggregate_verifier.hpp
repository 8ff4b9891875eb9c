/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "proofs/proof_engine.hpp"

namespace fcp::proofs {

  /**
   * Checks aggregate seal proofs with the proof engine it was given.
   * Has no mutable state, so may be shared between threads.
   */
  class AggregateVerifier {
   public:
    explicit AggregateVerifier(std::shared_ptr<ProofEngine> proofs);

    /**
     * @brief Verifies aggregate proof against the sector claims it carries
     * @return success if the proof is valid,
     * AggregateVerifierError::kVerificationFailure if the engine rejected it
     * or the native library failed on the proof bytes,
     * AggregateVerifierError::kVerificationFault if verification could not
     * be attempted (malformed claims, unmappable proof type, bad commitment
     * CID, caller error)
     */
    outcome::result<void> verifyAggregateSeals(
        const AggregateSealVerifyProofAndInfos &aggregate) const;

   private:
    std::shared_ptr<ProofEngine> proofs_;
  };

  enum class AggregateVerifierError {
    kVerificationFailure = 1,
    kVerificationFault,
  };
}  // namespace fcp::proofs

OUTCOME_HPP_DECLARE_ERROR(fcp::proofs, AggregateVerifierError);
