/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/coding.hpp"
#include "common/enum.hpp"
#include "primitives/cid/json_cid.hpp"
#include "primitives/sector/sector.hpp"
#include "proofs/sorted_sector_info.hpp"

namespace fcp::primitives::sector {
  using codec::json::decodeEnum;
  using codec::json::Get;
  using codec::json::Set;
  using codec::json::Value;

  JSON_ENCODE(RegisteredSealProof) {
    return Value{common::to_int(v)};
  }

  JSON_DECODE(RegisteredSealProof) {
    decodeEnum(v, j);
  }

  JSON_ENCODE(RegisteredPoStProof) {
    return Value{common::to_int(v)};
  }

  JSON_DECODE(RegisteredPoStProof) {
    decodeEnum(v, j);
  }

  JSON_ENCODE(RegisteredAggregationProof) {
    return Value{common::to_int(v)};
  }

  JSON_DECODE(RegisteredAggregationProof) {
    decodeEnum(v, j);
  }

  JSON_ENCODE(AggregateSealVerifyInfo) {
    Value j{rapidjson::kObjectType};
    Set(j, "Number", v.number, allocator);
    Set(j, "Randomness", gsl::make_span(v.randomness), allocator);
    Set(j,
        "InteractiveRandomness",
        gsl::make_span(v.interactive_randomness),
        allocator);
    Set(j, "SealedCID", v.sealed_cid, allocator);
    Set(j, "UnsealedCID", v.unsealed_cid, allocator);
    return j;
  }

  JSON_DECODE(AggregateSealVerifyInfo) {
    Get(j, "Number", v.number);
    Get(j, "Randomness", v.randomness);
    Get(j, "InteractiveRandomness", v.interactive_randomness);
    Get(j, "SealedCID", v.sealed_cid);
    Get(j, "UnsealedCID", v.unsealed_cid);
  }

  JSON_ENCODE(AggregateSealVerifyProofAndInfos) {
    Value j{rapidjson::kObjectType};
    Set(j, "Miner", v.miner, allocator);
    Set(j, "SealProof", v.seal_proof, allocator);
    Set(j, "AggregateProof", v.aggregate_proof, allocator);
    Set(j, "Proof", v.proof, allocator);
    Set(j, "Infos", v.infos, allocator);
    return j;
  }

  JSON_DECODE(AggregateSealVerifyProofAndInfos) {
    Get(j, "Miner", v.miner);
    Get(j, "SealProof", v.seal_proof);
    Get(j, "AggregateProof", v.aggregate_proof);
    Get(j, "Proof", v.proof);
    Get(j, "Infos", v.infos);
  }
}  // namespace fcp::primitives::sector

namespace fcp::proofs {
  using codec::json::Get;
  using codec::json::Set;
  using codec::json::Value;
  using primitives::sector::AggregateSealVerifyProofAndInfos;

  JSON_ENCODE(PublicSectorInfo) {
    Value j{rapidjson::kObjectType};
    Set(j, "PoStProofType", v.post_proof_type, allocator);
    Set(j, "SealedCID", v.sealed_cid, allocator);
    Set(j, "SectorNum", v.sector_num, allocator);
    return j;
  }

  JSON_DECODE(PublicSectorInfo) {
    Get(j, "PoStProofType", v.post_proof_type);
    Get(j, "SealedCID", v.sealed_cid);
    Get(j, "SectorNum", v.sector_num);
  }

  /// Sector info fields are flattened into the private info object
  JSON_ENCODE(PrivateSectorInfo) {
    Value j{rapidjson::kObjectType};
    Set(j, "SealProof", v.info.registered_proof, allocator);
    Set(j, "SectorNumber", v.info.sector, allocator);
    Set(j, "SealedCID", v.info.sealed_cid, allocator);
    Set(j, "CacheDirPath", v.cache_dir_path, allocator);
    Set(j, "PoStProofType", v.post_proof_type, allocator);
    Set(j, "SealedSectorPath", v.sealed_sector_path, allocator);
    return j;
  }

  JSON_DECODE(PrivateSectorInfo) {
    Get(j, "SealProof", v.info.registered_proof);
    Get(j, "SectorNumber", v.info.sector);
    Get(j, "SealedCID", v.info.sealed_cid);
    Get(j, "CacheDirPath", v.cache_dir_path);
    Get(j, "PoStProofType", v.post_proof_type);
    Get(j, "SealedSectorPath", v.sealed_sector_path);
  }

  /**
   * @brief Decodes aggregate seal proof record from json
   * @return decoded record or SortedSectorInfoError::kDecodeError
   */
  outcome::result<AggregateSealVerifyProofAndInfos>
  decodeAggregateSealVerifyProofAndInfos(BytesIn input);
}  // namespace fcp::proofs
