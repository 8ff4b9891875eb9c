/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/proof_param_provider_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fcp::proofs, ProofParamProviderError, e) {
  using fcp::proofs::ProofParamProviderError;
  switch (e) {
    case (ProofParamProviderError::kFileDoesNotOpen):
      return "Proof Param Provider: File does not open";
    case (ProofParamProviderError::kInvalidJSON):
      return "Proof Param Provider: JSON is invalid";
    case (ProofParamProviderError::kMissingEntry):
      return "Proof Param Provider: Missing entry in json";
    case (ProofParamProviderError::kInvalidSectorSize):
      return "Proof Param Provider: Sector size is invalid";
    case (ProofParamProviderError::kMissingFile):
      return "Proof Param Provider: Verifying key is missing in parameter "
             "cache";
    default:
      return "Proof Param Provider: unknown error";
  }
}
