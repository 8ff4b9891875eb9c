/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace fcp::config {
  using boost::program_options::options_description;
  using primitives::SectorSize;

  struct ProofsConfig {
    /// Directory with proof parameters and verifying keys
    std::string parameter_cache;
    /// Parameters manifest, "<parameter_cache>/parameters.json" if empty
    std::string parameters_json;
    SectorSize sector_size{SectorSize{32} << 30};
    bool check_params{false};
  };

  /**
   * Creates program option description for proofs parameters, parsed values
   * are stored to config on notify.
   *
   * @return proofs program option description
   */
  options_description configProofs(ProofsConfig &config);

  /**
   * Exports parameter cache location for the native proofs library and
   * checks verifying keys if requested.
   */
  outcome::result<void> applyProofsConfig(const ProofsConfig &config);
}  // namespace fcp::config
