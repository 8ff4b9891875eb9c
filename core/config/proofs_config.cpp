/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/proofs_config.hpp"

#include <cstdlib>

#include <boost/filesystem/path.hpp>

#include "common/error_text.hpp"
#include "proofs/proof_param_provider.hpp"

namespace fcp::config {
  namespace po = boost::program_options;

  options_description configProofs(ProofsConfig &config) {
    options_description optionsDescription("Proofs options");
    optionsDescription.add_options()(
        "proofs-parameter-cache",
        po::value<std::string>()
            ->default_value(proofs::getParamDir())
            ->notifier(
                [&config](const auto &dir) { config.parameter_cache = dir; }),
        "Directory with proof parameters and verifying keys");
    optionsDescription.add_options()(
        "proofs-parameters-json",
        po::value<std::string>()->notifier(
            [&config](const auto &path) { config.parameters_json = path; }),
        "Parameters manifest, defaults to parameters.json in the parameter "
        "cache");
    optionsDescription.add_options()(
        "proofs-sector-size",
        po::value<SectorSize>()
            ->default_value(config.sector_size)
            ->notifier([&config](SectorSize size) {
              if (size == 0 || (size & (size - 1)) != 0) {
                throw po::validation_error{
                    po::validation_error::invalid_option_value,
                    "proofs-sector-size"};
              }
              config.sector_size = size;
            }),
        "Size of sectors whose proofs are verified");
    optionsDescription.add_options()(
        "proofs-check-params",
        po::bool_switch()->notifier(
            [&config](bool check) { config.check_params = check; }),
        "Check that verifying keys are present on start");

    return optionsDescription;
  }

  outcome::result<void> applyProofsConfig(const ProofsConfig &config) {
    if (config.parameter_cache.empty()) {
      return ERROR_TEXT("applyProofsConfig: parameter cache is not set");
    }
    if (setenv("FIL_PROOFS_PARAMETER_CACHE",
               config.parameter_cache.c_str(),
               1)
        != 0) {
      return ERROR_TEXT("applyProofsConfig: cannot set parameter cache");
    }
    if (!config.check_params) {
      return outcome::success();
    }
    boost::filesystem::path json{config.parameters_json};
    if (json.empty()) {
      json = boost::filesystem::path{config.parameter_cache}
             / "parameters.json";
    }
    OUTCOME_TRY(params, proofs::readParamsJson(json));
    return proofs::checkVerifyingKeys(
        params, config.sector_size, config.parameter_cache);
  }
}  // namespace fcp::config
