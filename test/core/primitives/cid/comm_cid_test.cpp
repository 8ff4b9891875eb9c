/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/cid/comm_cid.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace fcp::primitives::cid {

  class CommCidTest : public ::testing::Test {
   public:
    Comm comm{
        "2d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b2170b"_blob32};
  };

  /**
   * @given CommR
   * @when convert it to CID
   * @then CID has sealed commitment codec and poseidon hash, and converts back
   */
  TEST_F(CommCidTest, Replica) {
    EXPECT_OUTCOME_TRUE(cid, replicaCommitmentToCid(comm));
    EXPECT_EQ(cid.version, CID::Version::V1);
    EXPECT_EQ(cid.content_type, CID::Multicodec::FILECOIN_COMMITMENT_SEALED);
    EXPECT_EQ(cid.content_address.getType(),
              libp2p::multi::HashType::poseidon_bls12_381_a1_fc1);
    EXPECT_OUTCOME_EQ(cidToReplicaCommitment(cid), comm);
  }

  /**
   * @given CommD
   * @when convert it to CID
   * @then CID has unsealed commitment codec and sha256 trunc hash, and converts
   * back
   */
  TEST_F(CommCidTest, Data) {
    EXPECT_OUTCOME_TRUE(cid, dataCommitmentToCid(comm));
    EXPECT_EQ(cid.content_type,
              CID::Multicodec::FILECOIN_COMMITMENT_UNSEALED);
    EXPECT_EQ(cid.content_address.getType(),
              libp2p::multi::HashType::sha2_256_trunc254_padded);
    EXPECT_OUTCOME_EQ(cidToDataCommitment(cid), comm);
  }

  /**
   * @given commitment CID of other kind and commitment of wrong size
   * @when convert them
   * @then errors
   */
  TEST_F(CommCidTest, Errors) {
    EXPECT_OUTCOME_TRUE(sealed, replicaCommitmentToCid(comm));
    EXPECT_OUTCOME_ERROR(CommitmentError::kWrongCodec,
                         cidToDataCommitment(sealed));
    EXPECT_OUTCOME_ERROR(CommitmentError::kWrongSize,
                         replicaCommitmentToCid("0102"_unhex));

    const CID other{
        "017112202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_cid};
    EXPECT_OUTCOME_ERROR(CommitmentError::kWrongCodec,
                         cidToReplicaCommitment(other));

    const CID rebuilt{CID::Version::V1,
                         CID::Multicodec::FILECOIN_COMMITMENT_SEALED,
                         sealed.content_address};
    EXPECT_OUTCOME_TRUE(unsealed, dataCommitmentToCid(comm));
    const CID sealed_with_sha{CID::Version::V1,
                              CID::Multicodec::FILECOIN_COMMITMENT_SEALED,
                              unsealed.content_address};
    EXPECT_OUTCOME_EQ(cidToReplicaCommitment(rebuilt), comm);
    EXPECT_OUTCOME_ERROR(CommitmentError::kWrongHash,
                         cidToReplicaCommitment(sealed_with_sha));
  }
}  // namespace fcp::primitives::cid
