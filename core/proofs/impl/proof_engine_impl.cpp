/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/impl/proof_engine_impl.hpp"

#include <filecoin-ffi/filcrypto.h>
#include <libp2p/multi/uvarint.hpp>

#include "common/ffi.hpp"
#include "primitives/cid/comm_cid.hpp"
#include "proofs/proofs_error.hpp"

#define PROOFS_TRY(label)                                     \
  do {                                                        \
    if (res_ptr->status_code                                  \
        != FCPResponseStatus::FCPResponseStatus_FCPNoError) { \
      logger_->error("{}: {}", label, res_ptr->error_msg);    \
      return cppResponseStatus(res_ptr->status_code);         \
    }                                                         \
  } while (0)

namespace fcp::proofs {
  namespace ffi = common::ffi;

  using common::Hash256;
  using primitives::cid::cidToDataCommitment;
  using primitives::cid::cidToReplicaCommitment;
  using primitives::sector::getRegisteredWindowPoStProof;
  using primitives::sector::getRegisteredWinningPoStProof;
  using primitives::sector::RegisteredAggregationProof;

  namespace {
    enum class PoStType {
      kWindow,
      kWinning,
    };

    ProofsError cppResponseStatus(FCPResponseStatus status) {
      switch (status) {
        case FCPResponseStatus::FCPResponseStatus_FCPUnclassifiedError:
          return ProofsError::kUnclassifiedError;
        case FCPResponseStatus::FCPResponseStatus_FCPCallerError:
          return ProofsError::kCallerError;
        case FCPResponseStatus::FCPResponseStatus_FCPReceiverError:
          return ProofsError::kReceiverError;
        default:
          return ProofsError::kUnknown;
      }
    }

    outcome::result<RegisteredPoStProof> cppRegisteredPoStProof(
        fil_RegisteredPoStProof proof_type) {
      switch (proof_type) {
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWindow2KiBV1:
          return RegisteredPoStProof::kStackedDRG2KiBWindowPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWindow8MiBV1:
          return RegisteredPoStProof::kStackedDRG8MiBWindowPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWindow512MiBV1:
          return RegisteredPoStProof::kStackedDRG512MiBWindowPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWindow32GiBV1:
          return RegisteredPoStProof::kStackedDRG32GiBWindowPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWindow64GiBV1:
          return RegisteredPoStProof::kStackedDRG64GiBWindowPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWinning2KiBV1:
          return RegisteredPoStProof::kStackedDRG2KiBWinningPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWinning8MiBV1:
          return RegisteredPoStProof::kStackedDRG8MiBWinningPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWinning512MiBV1:
          return RegisteredPoStProof::kStackedDRG512MiBWinningPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWinning32GiBV1:
          return RegisteredPoStProof::kStackedDRG32GiBWinningPoSt;
        case fil_RegisteredPoStProof::
            fil_RegisteredPoStProof_StackedDrgWinning64GiBV1:
          return RegisteredPoStProof::kStackedDRG64GiBWinningPoSt;
        default:
          return ProofsError::kInvalidPostProof;
      }
    }

    outcome::result<std::vector<PoStProof>> cppPoStProofs(
        gsl::span<const fil_PoStProof> c_post_proofs) {
      std::vector<PoStProof> cpp_post_proofs;
      cpp_post_proofs.reserve(c_post_proofs.size());
      for (const auto &c_post_proof : c_post_proofs) {
        OUTCOME_TRY(registered_proof,
                    cppRegisteredPoStProof(c_post_proof.registered_proof));
        cpp_post_proofs.push_back(PoStProof{
            registered_proof,
            {c_post_proof.proof_ptr,
             c_post_proof.proof_ptr + c_post_proof.proof_len}});  // NOLINT
      }
      return cpp_post_proofs;
    }

    outcome::result<fil_RegisteredPoStProof> cRegisteredPoStProof(
        RegisteredPoStProof proof_type) {
      switch (proof_type) {
        case RegisteredPoStProof::kStackedDRG2KiBWindowPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWindow2KiBV1;
        case RegisteredPoStProof::kStackedDRG8MiBWindowPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWindow8MiBV1;
        case RegisteredPoStProof::kStackedDRG512MiBWindowPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWindow512MiBV1;
        case RegisteredPoStProof::kStackedDRG32GiBWindowPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWindow32GiBV1;
        case RegisteredPoStProof::kStackedDRG64GiBWindowPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWindow64GiBV1;

        case RegisteredPoStProof::kStackedDRG2KiBWinningPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWinning2KiBV1;
        case RegisteredPoStProof::kStackedDRG8MiBWinningPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWinning8MiBV1;
        case RegisteredPoStProof::kStackedDRG512MiBWinningPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWinning512MiBV1;
        case RegisteredPoStProof::kStackedDRG32GiBWinningPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWinning32GiBV1;
        case RegisteredPoStProof::kStackedDRG64GiBWinningPoSt:
          return fil_RegisteredPoStProof::
              fil_RegisteredPoStProof_StackedDrgWinning64GiBV1;
        default:
          return ProofsError::kNoSuchPostProof;
      }
    }

    outcome::result<fil_RegisteredSealProof> cRegisteredSealProof(
        RegisteredSealProof proof_type) {
      switch (proof_type) {
        case RegisteredSealProof::kStackedDrg2KiBV1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg2KiBV1;
        case RegisteredSealProof::kStackedDrg8MiBV1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg8MiBV1;
        case RegisteredSealProof::kStackedDrg512MiBV1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg512MiBV1;
        case RegisteredSealProof::kStackedDrg32GiBV1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg32GiBV1;
        case RegisteredSealProof::kStackedDrg64GiBV1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg64GiBV1;
        case RegisteredSealProof::kStackedDrg2KiBV1_1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg2KiBV1_1;
        case RegisteredSealProof::kStackedDrg8MiBV1_1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg8MiBV1_1;
        case RegisteredSealProof::kStackedDrg512MiBV1_1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg512MiBV1_1;
        case RegisteredSealProof::kStackedDrg32GiBV1_1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg32GiBV1_1;
        case RegisteredSealProof::kStackedDrg64GiBV1_1:
          return fil_RegisteredSealProof::
              fil_RegisteredSealProof_StackedDrg64GiBV1_1;
        default:
          return ProofsError::kNoSuchSealProof;
      }
    }

    outcome::result<fil_RegisteredAggregationProof>
    cRegisteredAggregationProof(RegisteredAggregationProof type) {
      switch (type) {
        case RegisteredAggregationProof::SnarkPackV1:
          return fil_RegisteredAggregationProof_SnarkPackV1;
        default:
          return ProofsError::kNoSuchAggregationSealProof;
      }
    }

    /// Prover id is the uvarint of miner actor id, zero padded
    fil_32ByteArray toProverID(ActorId miner_id) {
      fil_32ByteArray prover = {};
      const libp2p::multi::UVarint varint{miner_id};
      const auto bytes{varint.toBytes()};
      std::copy(bytes.begin(), bytes.end(), prover.inner);
      return prover;
    }

    inline auto &c32ByteArray(const Hash256 &arr) {
      return (const fil_32ByteArray &)arr;
    }

    /**
     * Converts challenged sectors into public infos sorted in the order
     * native verifier expects
     */
    outcome::result<SortedPublicSectorInfo> sortedPublicSectorInfo(
        gsl::span<const SectorInfo> challenged_sectors, PoStType post_type) {
      std::vector<PublicSectorInfo> infos;
      infos.reserve(challenged_sectors.size());
      for (const auto &sector : challenged_sectors) {
        PublicSectorInfo info{{}, sector.sealed_cid, sector.sector};
        if (post_type == PoStType::kWinning) {
          OUTCOME_TRYA(info.post_proof_type,
                       getRegisteredWinningPoStProof(sector.registered_proof));
        } else {
          OUTCOME_TRYA(info.post_proof_type,
                       getRegisteredWindowPoStProof(sector.registered_proof));
        }
        infos.push_back(std::move(info));
      }
      return newSortedPublicSectorInfo(infos);
    }

    outcome::result<std::vector<fil_PublicReplicaInfo>> cPublicReplicaInfos(
        const SortedPublicSectorInfo &sorted) {
      std::vector<fil_PublicReplicaInfo> c_infos;
      c_infos.reserve(sorted.values().size());
      for (const auto &info : sorted.values()) {
        fil_PublicReplicaInfo c_info{};
        OUTCOME_TRYA(c_info.registered_proof,
                     cRegisteredPoStProof(info.post_proof_type));
        OUTCOME_TRY(comm_r, cidToReplicaCommitment(info.sealed_cid));
        ffi::array(c_info.comm_r, comm_r);
        c_info.sector_id = info.sector_num;
        c_infos.push_back(c_info);
      }
      return c_infos;
    }

    /// Result refers to path strings of sorted, which must outlive it
    outcome::result<std::vector<fil_PrivateReplicaInfo>> cPrivateReplicaInfos(
        const SortedPrivateSectorInfo &sorted) {
      std::vector<fil_PrivateReplicaInfo> c_infos;
      c_infos.reserve(sorted.values().size());
      for (const auto &info : sorted.values()) {
        fil_PrivateReplicaInfo c_info{};
        OUTCOME_TRYA(c_info.registered_proof,
                     cRegisteredPoStProof(info.post_proof_type));
        c_info.cache_dir_path = info.cache_dir_path.c_str();
        OUTCOME_TRY(comm_r, cidToReplicaCommitment(info.info.sealed_cid));
        ffi::array(c_info.comm_r, comm_r);
        c_info.replica_path = info.sealed_sector_path.c_str();
        c_info.sector_id = info.info.sector;
        c_infos.push_back(c_info);
      }
      return c_infos;
    }

    outcome::result<std::vector<fil_PoStProof>> cPoStProofs(
        gsl::span<const PoStProof> cpp_post_proofs) {
      std::vector<fil_PoStProof> c_proofs;
      c_proofs.reserve(cpp_post_proofs.size());
      for (const auto &cpp_post_proof : cpp_post_proofs) {
        OUTCOME_TRY(c_proof,
                    cRegisteredPoStProof(cpp_post_proof.registered_proof));
        c_proofs.push_back(fil_PoStProof{
            c_proof,
            cpp_post_proof.proof.size(),
            cpp_post_proof.proof.data(),
        });
      }
      return c_proofs;
    }
  }  // namespace

  ProofEngineImpl::ProofEngineImpl()
      : logger_{common::createLogger("proofs")} {}

  outcome::result<ChallengeIndexes>
  ProofEngineImpl::generateWinningPoStSectorChallenge(
      RegisteredPoStProof proof_type,
      ActorId miner_id,
      const PoStRandomness &randomness,
      uint64_t eligible_sectors_len) {
    auto rand31{randomness};
    rand31[31] = 0;

    OUTCOME_TRY(c_proof_type, cRegisteredPoStProof(proof_type));
    auto prover_id = toProverID(miner_id);

    auto res_ptr = ffi::wrap(
        fil_generate_winning_post_sector_challenge(c_proof_type,
                                                   c32ByteArray(rand31),
                                                   eligible_sectors_len,
                                                   prover_id),
        fil_destroy_generate_winning_post_sector_challenge);
    PROOFS_TRY("generateWinningPoStSectorChallenge");
    return ChallengeIndexes(res_ptr->ids_ptr,
                            res_ptr->ids_ptr + res_ptr->ids_len);  // NOLINT
  }

  outcome::result<std::vector<PoStProof>> ProofEngineImpl::generateWinningPoSt(
      ActorId miner_id,
      const SortedPrivateSectorInfo &private_replica_info,
      const PoStRandomness &randomness) {
    OUTCOME_TRY(c_infos, cPrivateReplicaInfos(private_replica_info));

    auto prover_id = toProverID(miner_id);
    auto res_ptr =
        ffi::wrap(fil_generate_winning_post(c32ByteArray(randomness),
                                            c_infos.data(),
                                            c_infos.size(),
                                            prover_id),
                  fil_destroy_generate_winning_post_response);
    PROOFS_TRY("generateWinningPoSt");
    return cppPoStProofs(
        gsl::make_span(res_ptr->proofs_ptr, res_ptr->proofs_len));
  }

  outcome::result<std::vector<PoStProof>> ProofEngineImpl::generateWindowPoSt(
      ActorId miner_id,
      const SortedPrivateSectorInfo &private_replica_info,
      const PoStRandomness &randomness) {
    OUTCOME_TRY(c_infos, cPrivateReplicaInfos(private_replica_info));

    auto prover_id = toProverID(miner_id);
    auto res_ptr =
        ffi::wrap(fil_generate_window_post(c32ByteArray(randomness),
                                           c_infos.data(),
                                           c_infos.size(),
                                           prover_id),
                  fil_destroy_generate_window_post_response);
    PROOFS_TRY("generateWindowPoSt");
    return cppPoStProofs(
        gsl::make_span(res_ptr->proofs_ptr, res_ptr->proofs_len));
  }

  outcome::result<bool> ProofEngineImpl::verifyWinningPoSt(
      const WinningPoStVerifyInfo &info) {
    OUTCOME_TRY(sorted,
                sortedPublicSectorInfo(info.challenged_sectors,
                                       PoStType::kWinning));
    OUTCOME_TRY(c_infos, cPublicReplicaInfos(sorted));
    OUTCOME_TRY(c_post_proofs, cPoStProofs(info.proofs));
    auto prover_id = toProverID(info.prover);

    auto res_ptr =
        ffi::wrap(fil_verify_winning_post(c32ByteArray(info.randomness),
                                          c_infos.data(),
                                          c_infos.size(),
                                          c_post_proofs.data(),
                                          c_post_proofs.size(),
                                          prover_id),
                  fil_destroy_verify_winning_post_response);
    PROOFS_TRY("verifyWinningPoSt");
    return res_ptr->is_valid;
  }

  outcome::result<bool> ProofEngineImpl::verifyWindowPoSt(
      const WindowPoStVerifyInfo &info) {
    OUTCOME_TRY(
        sorted,
        sortedPublicSectorInfo(info.challenged_sectors, PoStType::kWindow));
    OUTCOME_TRY(c_infos, cPublicReplicaInfos(sorted));
    OUTCOME_TRY(c_post_proofs, cPoStProofs(info.proofs));
    auto prover_id = toProverID(info.prover);

    auto res_ptr =
        ffi::wrap(fil_verify_window_post(c32ByteArray(info.randomness),
                                         c_infos.data(),
                                         c_infos.size(),
                                         c_post_proofs.data(),
                                         c_post_proofs.size(),
                                         prover_id),
                  fil_destroy_verify_window_post_response);
    PROOFS_TRY("verifyWindowPoSt");
    return res_ptr->is_valid;
  }

  outcome::result<bool> ProofEngineImpl::verifySeal(
      const SealVerifyInfo &info) {
    OUTCOME_TRY(c_proof_type, cRegisteredSealProof(info.seal_proof));
    OUTCOME_TRY(comm_r, cidToReplicaCommitment(info.sealed_cid));
    OUTCOME_TRY(comm_d, cidToDataCommitment(info.unsealed_cid));
    auto prover_id = toProverID(info.sector.miner);

    auto res_ptr =
        ffi::wrap(fil_verify_seal(c_proof_type,
                                  c32ByteArray(comm_r),
                                  c32ByteArray(comm_d),
                                  prover_id,
                                  c32ByteArray(info.randomness),
                                  c32ByteArray(info.interactive_randomness),
                                  info.sector.sector,
                                  info.proof.data(),
                                  info.proof.size()),
                  fil_destroy_verify_seal_response);
    PROOFS_TRY("verifySeal");
    return res_ptr->is_valid;
  }

  outcome::result<void> ProofEngineImpl::aggregateSealProofs(
      AggregateSealVerifyProofAndInfos &aggregate,
      const std::vector<BytesIn> &proofs) {
    OUTCOME_TRY(c_seal_proof, cRegisteredSealProof(aggregate.seal_proof));
    OUTCOME_TRY(c_aggregate_proof,
                cRegisteredAggregationProof(aggregate.aggregate_proof));
    std::vector<fil_32ByteArray> c_commrs, c_seeds;
    c_commrs.reserve(aggregate.infos.size());
    c_seeds.reserve(aggregate.infos.size());
    for (const auto &info : aggregate.infos) {
      OUTCOME_TRY(comm_r, cidToReplicaCommitment(info.sealed_cid));
      c_commrs.push_back(c32ByteArray(comm_r));
      c_seeds.push_back(c32ByteArray(info.interactive_randomness));
    }
    std::vector<fil_SealCommitPhase2Response> c_proofs;
    c_proofs.reserve(proofs.size());
    for (const auto &proof : proofs) {
      auto &c_proof{c_proofs.emplace_back()};
      c_proof.proof_ptr = proof.data();
      c_proof.proof_len = proof.size();
    }
    const auto res_ptr{ffi::wrap(fil_aggregate_seal_proofs(c_seal_proof,
                                                           c_aggregate_proof,
                                                           c_commrs.data(),
                                                           c_commrs.size(),
                                                           c_seeds.data(),
                                                           c_seeds.size(),
                                                           c_proofs.data(),
                                                           c_proofs.size()),
                                 fil_destroy_aggregate_proof)};
    PROOFS_TRY("aggregateSealProofs");
    copy(aggregate.proof, BytesIn(res_ptr->proof_ptr, res_ptr->proof_len));
    return outcome::success();
  }

  outcome::result<bool> ProofEngineImpl::verifyAggregateSeals(
      const AggregateSealVerifyProofAndInfos &aggregate) {
    OUTCOME_TRY(c_seal_proof, cRegisteredSealProof(aggregate.seal_proof));
    OUTCOME_TRY(c_aggregate_proof,
                cRegisteredAggregationProof(aggregate.aggregate_proof));
    const auto prover_id{toProverID(aggregate.miner)};
    std::vector<fil_AggregationInputs> c_infos;
    c_infos.reserve(aggregate.infos.size());
    for (const auto &info : aggregate.infos) {
      OUTCOME_TRY(comm_r, cidToReplicaCommitment(info.sealed_cid));
      OUTCOME_TRY(comm_d, cidToDataCommitment(info.unsealed_cid));
      c_infos.push_back(fil_AggregationInputs{
          c32ByteArray(comm_r),
          c32ByteArray(comm_d),
          info.number,
          c32ByteArray(info.randomness),
          c32ByteArray(info.interactive_randomness),
      });
    }
    const auto res_ptr{
        ffi::wrap(fil_verify_aggregate_seal_proof(c_seal_proof,
                                                  c_aggregate_proof,
                                                  prover_id,
                                                  aggregate.proof.data(),
                                                  aggregate.proof.size(),
                                                  c_infos.data(),
                                                  c_infos.size()),
                  fil_destroy_verify_aggregate_seal_response)};
    PROOFS_TRY("verifyAggregateSeals");
    return res_ptr->is_valid;
  }

  outcome::result<std::string> ProofEngineImpl::getPoStVersion(
      RegisteredPoStProof proof_type) {
    OUTCOME_TRY(c_proof_type, cRegisteredPoStProof(proof_type));
    auto res_ptr = ffi::wrap(fil_get_post_version(c_proof_type),
                             fil_destroy_string_response);
    PROOFS_TRY("getPoStVersion");
    return std::string(res_ptr->string_val);
  }

  outcome::result<std::string> ProofEngineImpl::getSealVersion(
      RegisteredSealProof proof_type) {
    OUTCOME_TRY(c_proof_type, cRegisteredSealProof(proof_type));
    auto res_ptr = ffi::wrap(fil_get_seal_version(c_proof_type),
                             fil_destroy_string_response);
    PROOFS_TRY("getSealVersion");
    return std::string(res_ptr->string_val);
  }
}  // namespace fcp::proofs
