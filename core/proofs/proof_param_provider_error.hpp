/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace fcp::proofs {

  /**
   * @brief Proof Param Provider returns these types of errors
   */
  enum class ProofParamProviderError {
    kFileDoesNotOpen = 1,
    kInvalidJSON,
    kMissingEntry,
    kInvalidSectorSize,
    kMissingFile,
  };

}  // namespace fcp::proofs

OUTCOME_HPP_DECLARE_ERROR(fcp::proofs, ProofParamProviderError);
