/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <gsl/span>

#include "common/outcome.hpp"
#include "primitives/types.hpp"
#include "proofs/proof_param_provider_error.hpp"

namespace fcp::proofs {
  using primitives::SectorSize;

  /// Entry of parameters.json
  struct ParamFile {
    std::string name;
    std::string cid;
    std::string digest;
    SectorSize sector_size{};
  };

  /**
   * @brief Directory of the proof parameters and verifying keys, taken from
   * FIL_PROOFS_PARAMETER_CACHE if set
   */
  std::string getParamDir();

  /**
   * @brief Reads parameters manifest
   * @param path - path to parameters.json
   * @return entries of the manifest
   */
  outcome::result<std::vector<ParamFile>> readParamsJson(
      const boost::filesystem::path &path);

  /**
   * @brief Checks that verifying keys of given sector size are present in
   * parameter cache
   * @param params - manifest entries
   * @param sector_size - size of sectors to verify proofs for
   * @param dir - parameter cache directory
   * @return kMissingEntry if manifest has no verifying key of that size,
   * kMissingFile if a key file is absent or empty
   */
  outcome::result<void> checkVerifyingKeys(gsl::span<const ParamFile> params,
                                           SectorSize sector_size,
                                           const boost::filesystem::path &dir);

}  // namespace fcp::proofs
