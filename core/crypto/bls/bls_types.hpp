/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/outcome.hpp"

namespace fcp::crypto::bls {
  constexpr size_t kSignatureLength = 96;
  constexpr size_t kPrivateKeyLength = 32;
  constexpr size_t kPublicKeyLength = 48;
  constexpr size_t kDigestLength = 96;

  using PrivateKey = std::array<uint8_t, kPrivateKeyLength>;
  using PublicKey = std::array<uint8_t, kPublicKeyLength>;
  using Signature = std::array<uint8_t, kSignatureLength>;
  using Digest = std::array<uint8_t, kDigestLength>;

  enum class Errors {
    kInternalError = 1,
    kSignatureGenerationFailed,
    kInvalidPrivateKey,
    kInvalidPublicKey,
    kAggregateError,
  };
}  // namespace fcp::crypto::bls

OUTCOME_HPP_DECLARE_ERROR(fcp::crypto::bls, Errors);
