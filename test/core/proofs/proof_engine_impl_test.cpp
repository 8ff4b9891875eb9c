/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/impl/proof_engine_impl.hpp"

#include <gtest/gtest.h>

#include "primitives/cid/comm_cid.hpp"
#include "proofs/proofs_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/proofs/sector_info.hpp"

namespace fcp::proofs {
  using primitives::cid::CommitmentError;
  using primitives::sector::AggregateSealVerifyInfo;
  using primitives::sector::Errors;
  using primitives::sector::SectorInfo;
  using testutils::sealedCid;
  using testutils::unsealedCid;

  class ProofEngineImplTest : public ::testing::Test {
   public:
    void SetUp() override {
      aggregate.miner = 1000;
      aggregate.seal_proof = RegisteredSealProof::kStackedDrg2KiBV1_1;
      aggregate.proof = Bytes{1, 2, 3};
      AggregateSealVerifyInfo info;
      info.number = 1;
      info.sealed_cid = sealedCid(1);
      info.unsealed_cid = unsealedCid(1);
      aggregate.infos.push_back(info);
    }

    std::shared_ptr<ProofEngine> proofs = std::make_shared<ProofEngineImpl>();
    AggregateSealVerifyProofAndInfos aggregate;
  };

  /**
   * @given aggregate with seal proof type unknown to native library
   * @when verify it
   * @then kNoSuchSealProof
   */
  TEST_F(ProofEngineImplTest, AggregateUnknownSealProof) {
    aggregate.seal_proof = RegisteredSealProof::kUndefined;
    EXPECT_OUTCOME_ERROR(ProofsError::kNoSuchSealProof,
                         proofs->verifyAggregateSeals(aggregate));
  }

  /**
   * @given aggregate with CommD CID in place of CommR CID
   * @when verify it
   * @then commitment conversion error
   */
  TEST_F(ProofEngineImplTest, AggregateMalformedCommitment) {
    aggregate.infos[0].sealed_cid = unsealedCid(1);
    EXPECT_OUTCOME_ERROR(CommitmentError::kWrongCodec,
                         proofs->verifyAggregateSeals(aggregate));
  }

  /**
   * @given challenged sector with undefined seal proof
   * @when verify window PoSt
   * @then seal proof to PoSt proof mapping error
   */
  TEST_F(ProofEngineImplTest, WindowPoStUnknownSealProof) {
    WindowPoStVerifyInfo info;
    info.prover = 1000;
    info.challenged_sectors.push_back(
        SectorInfo{RegisteredSealProof::kUndefined, 1, sealedCid(1)});
    EXPECT_OUTCOME_ERROR(Errors::kInvalidSealProof,
                         proofs->verifyWindowPoSt(info));
  }

  /**
   * @given undefined proof types
   * @when get versions
   * @then mapping errors
   */
  TEST_F(ProofEngineImplTest, VersionOfUnknownProof) {
    EXPECT_OUTCOME_ERROR(
        ProofsError::kNoSuchPostProof,
        proofs->getPoStVersion(RegisteredPoStProof::kUndefined));
    EXPECT_OUTCOME_ERROR(
        ProofsError::kNoSuchSealProof,
        proofs->getSealVersion(RegisteredSealProof::kUndefined));
  }

  /**
   * @given supported proof types
   * @when get versions
   * @then native library reports non empty versions
   */
  TEST_F(ProofEngineImplTest, Versions) {
    EXPECT_OUTCOME_TRUE(
        post_version,
        proofs->getPoStVersion(RegisteredPoStProof::kStackedDRG2KiBWindowPoSt));
    EXPECT_FALSE(post_version.empty());
    EXPECT_OUTCOME_TRUE(
        seal_version,
        proofs->getSealVersion(RegisteredSealProof::kStackedDrg2KiBV1_1));
    EXPECT_FALSE(seal_version.empty());
  }

  /**
   * @given private sector with unknown PoSt proof type
   * @when generate window PoSt
   * @then kNoSuchPostProof before native call
   */
  TEST_F(ProofEngineImplTest, GenerateWindowPoStUnknownProof) {
    auto info{testutils::privateInfo(1)};
    info.post_proof_type = RegisteredPoStProof::kUndefined;
    std::vector<PrivateSectorInfo> infos{info};
    EXPECT_OUTCOME_ERROR(ProofsError::kNoSuchPostProof,
                         proofs->generateWindowPoSt(
                             1000, newSortedPrivateSectorInfo(infos), {}));
  }
}  // namespace fcp::proofs
