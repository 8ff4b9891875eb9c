/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gsl/span>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/sector/sector.hpp"

namespace fcp::proofs {
  using primitives::SectorNumber;
  using primitives::sector::RegisteredPoStProof;
  using primitives::sector::SectorInfo;

  /// Sector as seen by a PoSt verifier
  struct PublicSectorInfo {
    RegisteredPoStProof post_proof_type{RegisteredPoStProof::kUndefined};
    CID sealed_cid;
    SectorNumber sector_num{};
  };

  inline bool operator==(const PublicSectorInfo &lhs,
                         const PublicSectorInfo &rhs) {
    return lhs.post_proof_type == rhs.post_proof_type
           && lhs.sealed_cid == rhs.sealed_cid
           && lhs.sector_num == rhs.sector_num;
  }

  /// Sector as seen by a PoSt prover, with the location of its replica
  struct PrivateSectorInfo {
    SectorInfo info;
    std::string cache_dir_path;
    RegisteredPoStProof post_proof_type{RegisteredPoStProof::kUndefined};
    std::string sealed_sector_path;
  };

  inline bool operator==(const PrivateSectorInfo &lhs,
                         const PrivateSectorInfo &rhs) {
    return lhs.info == rhs.info && lhs.cache_dir_path == rhs.cache_dir_path
           && lhs.post_proof_type == rhs.post_proof_type
           && lhs.sealed_sector_path == rhs.sealed_sector_path;
  }

  /**
   * Public sector infos ordered by the binary form of the sealed CID.
   * Equal CIDs are kept in input order.
   */
  class SortedPublicSectorInfo {
   public:
    SortedPublicSectorInfo() = default;

    const std::vector<PublicSectorInfo> &values() const;

    /**
     * @brief Encodes values as json array, keeping their order
     */
    outcome::result<Bytes> serialize() const;

    /**
     * @brief Decodes json array produced by serialize()
     * Order of the values is taken as is and is not checked
     * @return decoded collection or SortedSectorInfoError::kDecodeError
     */
    static outcome::result<SortedPublicSectorInfo> deserialize(BytesIn input);

   private:
    explicit SortedPublicSectorInfo(std::vector<PublicSectorInfo> values);

    friend SortedPublicSectorInfo newSortedPublicSectorInfo(
        gsl::span<const PublicSectorInfo> sector_info);

    std::vector<PublicSectorInfo> values_;
  };

  inline bool operator==(const SortedPublicSectorInfo &lhs,
                         const SortedPublicSectorInfo &rhs) {
    return lhs.values() == rhs.values();
  }

  /**
   * Private sector infos with unique sector numbers, ordered by sector
   * number.
   */
  class SortedPrivateSectorInfo {
   public:
    SortedPrivateSectorInfo() = default;

    const std::vector<PrivateSectorInfo> &values() const;

    outcome::result<Bytes> serialize() const;

    static outcome::result<SortedPrivateSectorInfo> deserialize(BytesIn input);

   private:
    explicit SortedPrivateSectorInfo(std::vector<PrivateSectorInfo> values);

    friend SortedPrivateSectorInfo newSortedPrivateSectorInfo(
        gsl::span<const PrivateSectorInfo> sector_info);

    friend outcome::result<SortedPrivateSectorInfo>
    splitSortedPrivateSectorInfo(const SortedPrivateSectorInfo &sorted,
                                 int64_t start,
                                 int64_t end);

    std::vector<PrivateSectorInfo> values_;
  };

  inline bool operator==(const SortedPrivateSectorInfo &lhs,
                         const SortedPrivateSectorInfo &rhs) {
    return lhs.values() == rhs.values();
  }

  /**
   * @brief Sorts sector infos by sealed CID bytes
   */
  SortedPublicSectorInfo newSortedPublicSectorInfo(
      gsl::span<const PublicSectorInfo> sector_info);

  /**
   * @brief Drops infos with already seen sector number, keeping the first
   * one, and sorts the rest by sector number
   */
  SortedPrivateSectorInfo newSortedPrivateSectorInfo(
      gsl::span<const PrivateSectorInfo> sector_info);

  /**
   * @brief Copies values in range [start, end)
   * @return new collection or SortedSectorInfoError::kRangeError if the range
   * is out of bounds
   */
  outcome::result<SortedPrivateSectorInfo> splitSortedPrivateSectorInfo(
      const SortedPrivateSectorInfo &sorted, int64_t start, int64_t end);

  enum class SortedSectorInfoError {
    kDecodeError = 1,
    kRangeError,
  };
}  // namespace fcp::proofs

OUTCOME_HPP_DECLARE_ERROR(fcp::proofs, SortedSectorInfoError);
