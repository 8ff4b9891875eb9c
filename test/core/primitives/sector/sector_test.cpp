/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/sector/sector.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace fcp::primitives::sector {

  /**
   * @given seal proof types of both versions
   * @when get PoSt proof types
   * @then PoSt types of same sector size returned
   */
  TEST(SectorTest, PoStProofOfSealProof) {
    EXPECT_OUTCOME_EQ(
        getRegisteredWindowPoStProof(RegisteredSealProof::kStackedDrg32GiBV1),
        RegisteredPoStProof::kStackedDRG32GiBWindowPoSt);
    EXPECT_OUTCOME_EQ(getRegisteredWindowPoStProof(
                          RegisteredSealProof::kStackedDrg32GiBV1_1),
                      RegisteredPoStProof::kStackedDRG32GiBWindowPoSt);
    EXPECT_OUTCOME_EQ(getRegisteredWinningPoStProof(
                          RegisteredSealProof::kStackedDrg2KiBV1_1),
                      RegisteredPoStProof::kStackedDRG2KiBWinningPoSt);
    EXPECT_OUTCOME_ERROR(
        Errors::kInvalidSealProof,
        getRegisteredWinningPoStProof(RegisteredSealProof::kUndefined));
  }

  /**
   * @given proof types
   * @when get sector size
   * @then size matches proof type
   */
  TEST(SectorTest, SectorSize) {
    EXPECT_OUTCOME_EQ(getSectorSize(RegisteredSealProof::kStackedDrg2KiBV1),
                      SectorSize{2048});
    EXPECT_OUTCOME_EQ(getSectorSize(RegisteredSealProof::kStackedDrg64GiBV1_1),
                      SectorSize{64} << 30);
    EXPECT_OUTCOME_EQ(
        getSectorSize(RegisteredPoStProof::kStackedDRG512MiBWindowPoSt),
        SectorSize{512} << 20);
    EXPECT_OUTCOME_ERROR(Errors::kInvalidSealProof,
                         getSectorSize(RegisteredSealProof::kUndefined));
    EXPECT_OUTCOME_ERROR(Errors::kInvalidPoStProof,
                         getSectorSize(RegisteredPoStProof::kUndefined));
  }
}  // namespace fcp::primitives::sector
