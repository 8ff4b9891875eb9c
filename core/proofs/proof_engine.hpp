/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gsl/span>

#include "common/outcome.hpp"
#include "primitives/sector/sector.hpp"
#include "proofs/sorted_sector_info.hpp"

namespace fcp::proofs {
  using primitives::ActorId;
  using primitives::SectorNumber;
  using primitives::sector::AggregateSealVerifyProofAndInfos;
  using primitives::sector::PoStProof;
  using primitives::sector::PoStRandomness;
  using primitives::sector::RegisteredPoStProof;
  using primitives::sector::RegisteredSealProof;
  using primitives::sector::SealVerifyInfo;
  using primitives::sector::WindowPoStVerifyInfo;
  using primitives::sector::WinningPoStVerifyInfo;
  using ChallengeIndexes = std::vector<uint64_t>;

  /**
   * Proving and verification calls of the native proofs library
   */
  class ProofEngine {
   public:
    virtual ~ProofEngine() = default;

    virtual outcome::result<ChallengeIndexes>
    generateWinningPoStSectorChallenge(RegisteredPoStProof proof_type,
                                       ActorId miner_id,
                                       const PoStRandomness &randomness,
                                       uint64_t eligible_sectors_len) = 0;

    virtual outcome::result<std::vector<PoStProof>> generateWinningPoSt(
        ActorId miner_id,
        const SortedPrivateSectorInfo &private_replica_info,
        const PoStRandomness &randomness) = 0;

    virtual outcome::result<std::vector<PoStProof>> generateWindowPoSt(
        ActorId miner_id,
        const SortedPrivateSectorInfo &private_replica_info,
        const PoStRandomness &randomness) = 0;

    virtual outcome::result<bool> verifyWinningPoSt(
        const WinningPoStVerifyInfo &info) = 0;

    virtual outcome::result<bool> verifyWindowPoSt(
        const WindowPoStVerifyInfo &info) = 0;

    /**
     * VerifySeal returns true if the sealing operation from which its inputs
     * were derived was valid, and false if not.
     */
    virtual outcome::result<bool> verifySeal(const SealVerifyInfo &info) = 0;

    /**
     * @brief Aggregates seal proofs of the sectors listed in aggregate.infos,
     * in the same order, and stores the result in aggregate.proof
     */
    virtual outcome::result<void> aggregateSealProofs(
        AggregateSealVerifyProofAndInfos &aggregate,
        const std::vector<BytesIn> &proofs) = 0;

    /**
     * @brief Verifies aggregate proof against the per-sector claims
     * @return false if the proof is rejected, error if verification could
     * not be run
     */
    virtual outcome::result<bool> verifyAggregateSeals(
        const AggregateSealVerifyProofAndInfos &aggregate) = 0;

    /**
     * @brief Returns the version of the provided PoSt proof
     */
    virtual outcome::result<std::string> getPoStVersion(
        RegisteredPoStProof proof_type) = 0;

    /**
     * @brief  Returns the version of the provided seal proof type
     */
    virtual outcome::result<std::string> getSealVersion(
        RegisteredSealProof proof_type) = 0;
  };
}  // namespace fcp::proofs
