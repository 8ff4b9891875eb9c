/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gsl/span>

#include "crypto/bls/bls_types.hpp"

namespace fcp::crypto::bls {
  /**
   * @class BLS provider, wrapper around the native BLS implementation
   */
  class BlsProvider {
   public:
    virtual ~BlsProvider() = default;

    /**
     * @brief Generate BLS signature
     * @param message - data to sign
     * @param key - BLS private key
     * @return BLS signature or error code
     */
    virtual outcome::result<Signature> sign(gsl::span<const uint8_t> message,
                                            const PrivateKey &key) const = 0;

    /**
     * @brief Verify BLS signature
     * @param message - signed data
     * @param signature - BLS signature for verifying
     * @param key - BLS public key
     * @return signature status or error code
     */
    virtual outcome::result<bool> verifySignature(
        gsl::span<const uint8_t> message,
        const Signature &signature,
        const PublicKey &key) const = 0;

    /**
     * @brief Aggregate BLS signatures
     * @param signatures - signatures to aggregate
     * @return aggregated signature
     */
    virtual outcome::result<Signature> aggregateSignatures(
        gsl::span<const Signature> signatures) const = 0;
  };
}  // namespace fcp::crypto::bls
