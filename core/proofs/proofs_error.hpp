/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace fcp::proofs {
  /// Errors of ProofEngineImpl, mapped from proof types and native statuses
  enum class ProofsError {
    kNoSuchSealProof = 1,
    kNoSuchPostProof,
    kInvalidPostProof,
    kUnclassifiedError,
    kCallerError,
    kReceiverError,
    kNoSuchAggregationSealProof,
    kUnknown = 1000
  };
}  // namespace fcp::proofs

OUTCOME_HPP_DECLARE_ERROR(fcp::proofs, ProofsError);
