/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace fcp::crypto::randomness {

  /// @brief randomness value type
  using Randomness = common::Hash256;

  constexpr size_t kRandomnessLength = 32;
}  // namespace fcp::crypto::randomness
