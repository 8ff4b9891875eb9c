/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "proofs/proof_engine.hpp"

#include <gmock/gmock.h>

namespace fcp::proofs {

  class ProofEngineMock : public ProofEngine {
   public:
    MOCK_METHOD4(generateWinningPoStSectorChallenge,
                 outcome::result<ChallengeIndexes>(RegisteredPoStProof,
                                                   ActorId,
                                                   const PoStRandomness &,
                                                   uint64_t));

    MOCK_METHOD3(generateWinningPoSt,
                 outcome::result<std::vector<PoStProof>>(
                     ActorId,
                     const SortedPrivateSectorInfo &,
                     const PoStRandomness &));

    MOCK_METHOD3(generateWindowPoSt,
                 outcome::result<std::vector<PoStProof>>(
                     ActorId,
                     const SortedPrivateSectorInfo &,
                     const PoStRandomness &));

    MOCK_METHOD1(verifyWinningPoSt,
                 outcome::result<bool>(const WinningPoStVerifyInfo &));

    MOCK_METHOD1(verifyWindowPoSt,
                 outcome::result<bool>(const WindowPoStVerifyInfo &));

    MOCK_METHOD1(verifySeal, outcome::result<bool>(const SealVerifyInfo &));

    MOCK_METHOD2(aggregateSealProofs,
                 outcome::result<void>(AggregateSealVerifyProofAndInfos &,
                                       const std::vector<BytesIn> &));

    MOCK_METHOD1(verifyAggregateSeals,
                 outcome::result<bool>(
                     const AggregateSealVerifyProofAndInfos &));

    MOCK_METHOD1(getPoStVersion,
                 outcome::result<std::string>(RegisteredPoStProof));

    MOCK_METHOD1(getSealVersion,
                 outcome::result<std::string>(RegisteredSealProof));
  };
}  // namespace fcp::proofs
