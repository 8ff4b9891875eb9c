/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "proofs/proof_engine.hpp"

#include "common/logger.hpp"

namespace fcp::proofs {
  class ProofEngineImpl : public ProofEngine {
   public:
    ProofEngineImpl();

    outcome::result<ChallengeIndexes> generateWinningPoStSectorChallenge(
        RegisteredPoStProof proof_type,
        ActorId miner_id,
        const PoStRandomness &randomness,
        uint64_t eligible_sectors_len) override;

    outcome::result<std::vector<PoStProof>> generateWinningPoSt(
        ActorId miner_id,
        const SortedPrivateSectorInfo &private_replica_info,
        const PoStRandomness &randomness) override;

    outcome::result<std::vector<PoStProof>> generateWindowPoSt(
        ActorId miner_id,
        const SortedPrivateSectorInfo &private_replica_info,
        const PoStRandomness &randomness) override;

    outcome::result<bool> verifyWinningPoSt(
        const WinningPoStVerifyInfo &info) override;

    outcome::result<bool> verifyWindowPoSt(
        const WindowPoStVerifyInfo &info) override;

    outcome::result<bool> verifySeal(const SealVerifyInfo &info) override;

    outcome::result<void> aggregateSealProofs(
        AggregateSealVerifyProofAndInfos &aggregate,
        const std::vector<BytesIn> &proofs) override;

    outcome::result<bool> verifyAggregateSeals(
        const AggregateSealVerifyProofAndInfos &aggregate) override;

    outcome::result<std::string> getPoStVersion(
        RegisteredPoStProof proof_type) override;

    outcome::result<std::string> getSealVersion(
        RegisteredSealProof proof_type) override;

   private:
    common::Logger logger_;
  };
}  // namespace fcp::proofs
