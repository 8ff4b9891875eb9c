/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/sector/sector.hpp"

namespace fcp::primitives::sector {
  namespace {
    constexpr SectorSize kKiB{1024};
    constexpr SectorSize kMiB{kKiB << 10};
    constexpr SectorSize kGiB{kMiB << 10};
  }  // namespace

  outcome::result<RegisteredPoStProof> getRegisteredWindowPoStProof(
      RegisteredSealProof proof) {
    switch (proof) {
      case RegisteredSealProof::kStackedDrg64GiBV1:
      case RegisteredSealProof::kStackedDrg64GiBV1_1:
        return RegisteredPoStProof::kStackedDRG64GiBWindowPoSt;
      case RegisteredSealProof::kStackedDrg32GiBV1:
      case RegisteredSealProof::kStackedDrg32GiBV1_1:
        return RegisteredPoStProof::kStackedDRG32GiBWindowPoSt;
      case RegisteredSealProof::kStackedDrg512MiBV1:
      case RegisteredSealProof::kStackedDrg512MiBV1_1:
        return RegisteredPoStProof::kStackedDRG512MiBWindowPoSt;
      case RegisteredSealProof::kStackedDrg8MiBV1:
      case RegisteredSealProof::kStackedDrg8MiBV1_1:
        return RegisteredPoStProof::kStackedDRG8MiBWindowPoSt;
      case RegisteredSealProof::kStackedDrg2KiBV1:
      case RegisteredSealProof::kStackedDrg2KiBV1_1:
        return RegisteredPoStProof::kStackedDRG2KiBWindowPoSt;
      default:
        return Errors::kInvalidSealProof;
    }
  }

  outcome::result<RegisteredPoStProof> getRegisteredWinningPoStProof(
      RegisteredSealProof proof) {
    switch (proof) {
      case RegisteredSealProof::kStackedDrg64GiBV1:
      case RegisteredSealProof::kStackedDrg64GiBV1_1:
        return RegisteredPoStProof::kStackedDRG64GiBWinningPoSt;
      case RegisteredSealProof::kStackedDrg32GiBV1:
      case RegisteredSealProof::kStackedDrg32GiBV1_1:
        return RegisteredPoStProof::kStackedDRG32GiBWinningPoSt;
      case RegisteredSealProof::kStackedDrg512MiBV1:
      case RegisteredSealProof::kStackedDrg512MiBV1_1:
        return RegisteredPoStProof::kStackedDRG512MiBWinningPoSt;
      case RegisteredSealProof::kStackedDrg8MiBV1:
      case RegisteredSealProof::kStackedDrg8MiBV1_1:
        return RegisteredPoStProof::kStackedDRG8MiBWinningPoSt;
      case RegisteredSealProof::kStackedDrg2KiBV1:
      case RegisteredSealProof::kStackedDrg2KiBV1_1:
        return RegisteredPoStProof::kStackedDRG2KiBWinningPoSt;
      default:
        return Errors::kInvalidSealProof;
    }
  }

  outcome::result<SectorSize> getSectorSize(RegisteredSealProof proof) {
    switch (proof) {
      case RegisteredSealProof::kStackedDrg2KiBV1:
      case RegisteredSealProof::kStackedDrg2KiBV1_1:
        return 2 * kKiB;
      case RegisteredSealProof::kStackedDrg8MiBV1:
      case RegisteredSealProof::kStackedDrg8MiBV1_1:
        return 8 * kMiB;
      case RegisteredSealProof::kStackedDrg512MiBV1:
      case RegisteredSealProof::kStackedDrg512MiBV1_1:
        return 512 * kMiB;
      case RegisteredSealProof::kStackedDrg32GiBV1:
      case RegisteredSealProof::kStackedDrg32GiBV1_1:
        return 32 * kGiB;
      case RegisteredSealProof::kStackedDrg64GiBV1:
      case RegisteredSealProof::kStackedDrg64GiBV1_1:
        return 64 * kGiB;
      default:
        return Errors::kInvalidSealProof;
    }
  }

  outcome::result<SectorSize> getSectorSize(RegisteredPoStProof proof) {
    switch (proof) {
      case RegisteredPoStProof::kStackedDRG2KiBWinningPoSt:
      case RegisteredPoStProof::kStackedDRG2KiBWindowPoSt:
        return 2 * kKiB;
      case RegisteredPoStProof::kStackedDRG8MiBWinningPoSt:
      case RegisteredPoStProof::kStackedDRG8MiBWindowPoSt:
        return 8 * kMiB;
      case RegisteredPoStProof::kStackedDRG512MiBWinningPoSt:
      case RegisteredPoStProof::kStackedDRG512MiBWindowPoSt:
        return 512 * kMiB;
      case RegisteredPoStProof::kStackedDRG32GiBWinningPoSt:
      case RegisteredPoStProof::kStackedDRG32GiBWindowPoSt:
        return 32 * kGiB;
      case RegisteredPoStProof::kStackedDRG64GiBWinningPoSt:
      case RegisteredPoStProof::kStackedDRG64GiBWindowPoSt:
        return 64 * kGiB;
      default:
        return Errors::kInvalidPoStProof;
    }
  }
}  // namespace fcp::primitives::sector

OUTCOME_CPP_DEFINE_CATEGORY(fcp::primitives::sector, Errors, e) {
  using fcp::primitives::sector::Errors;
  switch (e) {
    case Errors::kInvalidPoStProof:
      return "Sector: unsupported PoSt proof type";
    case Errors::kInvalidSealProof:
      return "Sector: unsupported seal proof type";
  }
  return "Sector: unknown error";
}
