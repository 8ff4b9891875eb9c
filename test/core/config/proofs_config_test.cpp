/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/proofs_config.hpp"

#include <cstdlib>

#include <gtest/gtest.h>

#include "proofs/proof_param_provider.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace fcp::config {
  namespace po = boost::program_options;
  using proofs::ProofParamProviderError;

  class ProofsConfigTest : public ::test::BaseFS_Test {
   public:
    ProofsConfigTest() : ::test::BaseFS_Test("fcp_proofs_config_test") {}

    void parse(std::vector<const char *> args) {
      args.insert(args.begin(), "test");
      po::variables_map vm;
      po::store(po::parse_command_line(
                    static_cast<int>(args.size()), args.data(), options),
                vm);
      po::notify(vm);
    }

    ProofsConfig config;
    po::options_description options{configProofs(config)};
  };

  /**
   * @given no proofs options
   * @when parse command line
   * @then defaults are set
   */
  TEST_F(ProofsConfigTest, Defaults) {
    parse({});
    EXPECT_EQ(config.parameter_cache, proofs::getParamDir());
    EXPECT_TRUE(config.parameters_json.empty());
    EXPECT_EQ(config.sector_size, SectorSize{32} << 30);
    EXPECT_FALSE(config.check_params);
  }

  /**
   * @given all proofs options
   * @when parse command line
   * @then config has parsed values
   */
  TEST_F(ProofsConfigTest, Options) {
    parse({"--proofs-parameter-cache",
           "/tmp/params",
           "--proofs-parameters-json",
           "/tmp/parameters.json",
           "--proofs-sector-size",
           "2048",
           "--proofs-check-params"});
    EXPECT_EQ(config.parameter_cache, "/tmp/params");
    EXPECT_EQ(config.parameters_json, "/tmp/parameters.json");
    EXPECT_EQ(config.sector_size, 2048);
    EXPECT_TRUE(config.check_params);
  }

  /**
   * @given sector size which is not a power of two
   * @when parse command line
   * @then parsing fails
   */
  TEST_F(ProofsConfigTest, InvalidSectorSize) {
    EXPECT_THROW(parse({"--proofs-sector-size", "3000"}), po::error);
  }

  /**
   * @given parameter cache with manifest and verifying key
   * @when apply config with check
   * @then env is exported and check passes, unless key is missing
   */
  TEST_F(ProofsConfigTest, Apply) {
    createFile(
        "parameters.json",
        R"({"a-2KiB.vk": {"cid": "Qm", "digest": "a", "sector_size": 2048}})");
    config.parameter_cache = getPathString();
    config.sector_size = 2048;
    config.check_params = true;
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kMissingFile,
                         applyProofsConfig(config));
    EXPECT_EQ(std::string{std::getenv("FIL_PROOFS_PARAMETER_CACHE")},
              getPathString());

    createFile("a-2KiB.vk", "key");
    EXPECT_OUTCOME_TRUE_1(applyProofsConfig(config));
  }
}  // namespace fcp::config
