/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/bytes.hpp"
#include "crypto/randomness/randomness_types.hpp"
#include "primitives/cid/cid.hpp"
#include "primitives/types.hpp"

namespace fcp::primitives::sector {
  using crypto::randomness::Randomness;
  using primitives::ActorId;
  using primitives::DealId;
  using primitives::SectorNumber;
  using primitives::SectorSize;

  struct SectorId {
    ActorId miner{};
    SectorNumber sector{};
  };
  inline bool operator==(const SectorId &lhs, const SectorId &rhs) {
    return lhs.miner == rhs.miner && lhs.sector == rhs.sector;
  }

  enum class RegisteredSealProof : int64_t {
    kUndefined = -1,

    kStackedDrg2KiBV1,
    kStackedDrg8MiBV1,
    kStackedDrg512MiBV1,
    kStackedDrg32GiBV1,
    kStackedDrg64GiBV1,

    kStackedDrg2KiBV1_1,
    kStackedDrg8MiBV1_1,
    kStackedDrg512MiBV1_1,
    kStackedDrg32GiBV1_1,
    kStackedDrg64GiBV1_1,
  };

  enum class RegisteredPoStProof : int64_t {
    kUndefined = -1,

    kStackedDRG2KiBWinningPoSt,
    kStackedDRG8MiBWinningPoSt,
    kStackedDRG512MiBWinningPoSt,
    kStackedDRG32GiBWinningPoSt,
    kStackedDRG64GiBWinningPoSt,

    kStackedDRG2KiBWindowPoSt,
    kStackedDRG8MiBWindowPoSt,
    kStackedDRG512MiBWindowPoSt,
    kStackedDRG32GiBWindowPoSt,
    kStackedDRG64GiBWindowPoSt,
  };

  enum class RegisteredAggregationProof : int64_t {
    SnarkPackV1,
  };

  /**
   * Produces the PoSt-specific RegisteredProof corresponding to the receiving
   * RegisteredSealProof.
   */
  outcome::result<RegisteredPoStProof> getRegisteredWindowPoStProof(
      RegisteredSealProof proof);
  outcome::result<RegisteredPoStProof> getRegisteredWinningPoStProof(
      RegisteredSealProof proof);

  outcome::result<SectorSize> getSectorSize(RegisteredSealProof proof);
  outcome::result<SectorSize> getSectorSize(RegisteredPoStProof proof);

  using SealRandomness = Randomness;

  using Ticket = SealRandomness;

  using InteractiveRandomness = Randomness;

  using PoStRandomness = Randomness;

  using Proof = Bytes;

  /**
   * SealVerifyInfo is the structure of all the information a verifier needs
   * to verify a Seal.
   */
  struct SealVerifyInfo {
    RegisteredSealProof seal_proof{RegisteredSealProof::kUndefined};
    SectorId sector;
    std::vector<DealId> deals;
    SealRandomness randomness;
    InteractiveRandomness interactive_randomness;
    Proof proof;
    /// CommR
    CID sealed_cid;
    /// CommD
    CID unsealed_cid;
  };

  struct PoStProof {
    RegisteredPoStProof registered_proof = RegisteredPoStProof::kUndefined;
    Proof proof;
  };

  inline bool operator==(const PoStProof &lhs, const PoStProof &rhs) {
    return lhs.registered_proof == rhs.registered_proof
           && lhs.proof == rhs.proof;
  }

  struct SectorInfo {
    RegisteredSealProof registered_proof{RegisteredSealProof::kUndefined};
    SectorNumber sector{};
    /// CommR
    CID sealed_cid;
  };

  inline bool operator==(const SectorInfo &lhs, const SectorInfo &rhs) {
    return lhs.registered_proof == rhs.registered_proof
           && lhs.sector == rhs.sector && lhs.sealed_cid == rhs.sealed_cid;
  }

  // Information needed to verify a Winning PoSt attached to a block header.
  struct WinningPoStVerifyInfo {
    PoStRandomness randomness;
    std::vector<PoStProof> proofs;
    std::vector<SectorInfo> challenged_sectors;
    ActorId prover{};
  };

  // Information needed to verify a Window PoSt submitted directly to a miner
  // actor.
  struct WindowPoStVerifyInfo {
    PoStRandomness randomness;
    std::vector<PoStProof> proofs;
    std::vector<SectorInfo> challenged_sectors;
    ActorId prover{};
  };

  /// Per-sector claim covered by an aggregate seal proof
  struct AggregateSealVerifyInfo {
    SectorNumber number{};
    SealRandomness randomness;
    InteractiveRandomness interactive_randomness;
    CID sealed_cid;
    CID unsealed_cid;
  };

  inline bool operator==(const AggregateSealVerifyInfo &lhs,
                         const AggregateSealVerifyInfo &rhs) {
    return lhs.number == rhs.number && lhs.randomness == rhs.randomness
           && lhs.interactive_randomness == rhs.interactive_randomness
           && lhs.sealed_cid == rhs.sealed_cid
           && lhs.unsealed_cid == rhs.unsealed_cid;
  }

  struct AggregateSealVerifyProofAndInfos {
    ActorId miner{};
    RegisteredSealProof seal_proof{RegisteredSealProof::kUndefined};
    RegisteredAggregationProof aggregate_proof{
        RegisteredAggregationProof::SnarkPackV1};
    Bytes proof;
    std::vector<AggregateSealVerifyInfo> infos;
  };

  inline bool operator==(const AggregateSealVerifyProofAndInfos &lhs,
                         const AggregateSealVerifyProofAndInfos &rhs) {
    return lhs.miner == rhs.miner && lhs.seal_proof == rhs.seal_proof
           && lhs.aggregate_proof == rhs.aggregate_proof
           && lhs.proof == rhs.proof && lhs.infos == rhs.infos;
  }

  enum class Errors {
    kInvalidPoStProof = 1,
    kInvalidSealProof,
  };
}  // namespace fcp::primitives::sector

OUTCOME_HPP_DECLARE_ERROR(fcp::primitives::sector, Errors);
