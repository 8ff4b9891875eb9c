/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/proof_param_provider.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace fcp::proofs {

  class ProofParamProviderTest : public ::test::BaseFS_Test {
   public:
    ProofParamProviderTest()
        : ::test::BaseFS_Test("fcp_proof_param_provider_test") {}

    const std::string manifest{
        R"({
  "v28-stacked-proof-of-replication-2KiB.params": {
    "cid": "QmParams2",
    "digest": "a1",
    "sector_size": 2048
  },
  "v28-stacked-proof-of-replication-2KiB.vk": {
    "cid": "QmVk2",
    "digest": "a2",
    "sector_size": 2048
  },
  "v28-stacked-proof-of-replication-8MiB.vk": {
    "cid": "QmVk8",
    "digest": "a3",
    "sector_size": 8388608
  }
})"};
  };

  /**
   * @given parameters manifest
   * @when read it
   * @then all entries are read with their names
   */
  TEST_F(ProofParamProviderTest, ReadManifest) {
    const auto path{createFile("parameters.json", manifest)};
    EXPECT_OUTCOME_TRUE(params, readParamsJson(path));
    ASSERT_EQ(params.size(), 3);
    EXPECT_EQ(params[1].name, "v28-stacked-proof-of-replication-2KiB.vk");
    EXPECT_EQ(params[1].cid, "QmVk2");
    EXPECT_EQ(params[1].digest, "a2");
    EXPECT_EQ(params[1].sector_size, 2048);
  }

  /**
   * @given missing, malformed and incomplete manifests
   * @when read them
   * @then corresponding errors
   */
  TEST_F(ProofParamProviderTest, ReadMalformedManifest) {
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kFileDoesNotOpen,
                         readParamsJson(base_path / "absent.json"));
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kInvalidJSON,
                         readParamsJson(createFile("a.json", "[1, 2]")));
    EXPECT_OUTCOME_ERROR(
        ProofParamProviderError::kMissingEntry,
        readParamsJson(createFile(
            "b.json", R"({"a.vk": {"cid": "Qm", "sector_size": 2048}})")));
    EXPECT_OUTCOME_ERROR(
        ProofParamProviderError::kInvalidSectorSize,
        readParamsJson(createFile(
            "c.json",
            R"({"a.vk": {"cid": "Qm", "digest": "a", "sector_size": "2KiB"}})")));
  }

  /**
   * @given parameter cache with 2KiB verifying key
   * @when check verifying keys of 2KiB and 8MiB sectors
   * @then 2KiB check passes, 8MiB key is missing
   */
  TEST_F(ProofParamProviderTest, CheckVerifyingKeys) {
    EXPECT_OUTCOME_TRUE(params,
                        readParamsJson(createFile("parameters.json", manifest)));
    createFile("v28-stacked-proof-of-replication-2KiB.vk", "key");
    EXPECT_OUTCOME_TRUE_1(checkVerifyingKeys(params, 2048, base_path));
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kMissingFile,
                         checkVerifyingKeys(params, 8 << 20, base_path));
  }

  /**
   * @given empty verifying key file
   * @when check verifying keys
   * @then kMissingFile
   */
  TEST_F(ProofParamProviderTest, EmptyVerifyingKey) {
    EXPECT_OUTCOME_TRUE(params,
                        readParamsJson(createFile("parameters.json", manifest)));
    createFile("v28-stacked-proof-of-replication-2KiB.vk");
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kMissingFile,
                         checkVerifyingKeys(params, 2048, base_path));
  }

  /**
   * @given manifest without verifying keys of 512MiB sectors
   * @when check verifying keys of 512MiB sectors
   * @then kMissingEntry
   */
  TEST_F(ProofParamProviderTest, NoVerifyingKeyOfSectorSize) {
    EXPECT_OUTCOME_TRUE(params,
                        readParamsJson(createFile("parameters.json", manifest)));
    EXPECT_OUTCOME_ERROR(ProofParamProviderError::kMissingEntry,
                         checkVerifyingKeys(params, 512 << 20, base_path));
  }
}  // namespace fcp::proofs
