/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace fcp::common {

  /**
   * @given hex string of blob size
   * @when create blob from it
   * @then blob has the bytes and prints same hex
   */
  TEST(BlobTest, FromHex) {
    const std::string hex{"00ff10"};
    EXPECT_OUTCOME_TRUE(blob, Blob<3>::fromHex(hex));
    EXPECT_EQ(blob, (Blob<3>{{0x00, 0xff, 0x10}}));
    EXPECT_EQ(blob.toHex(), hex);
  }

  /**
   * @given input of wrong length
   * @when create blob from it
   * @then error
   */
  TEST(BlobTest, WrongLength) {
    EXPECT_OUTCOME_ERROR(BlobError::INCORRECT_LENGTH,
                         Blob<3>::fromHex("00ff"));
    EXPECT_OUTCOME_ERROR(BlobError::INCORRECT_LENGTH,
                         Blob<3>::fromString("abcd"));
    const std::vector<uint8_t> bytes(4);
    EXPECT_OUTCOME_ERROR(BlobError::INCORRECT_LENGTH, Blob<3>::fromSpan(bytes));
  }

  /**
   * @given malformed hex
   * @when unhex it
   * @then error
   */
  TEST(HexTest, Unhex) {
    EXPECT_OUTCOME_EQ(unhex("0aFF"), (std::vector<uint8_t>{0x0a, 0xff}));
    EXPECT_OUTCOME_ERROR(UnhexError::NOT_ENOUGH_INPUT, unhex("0af"));
    EXPECT_OUTCOME_ERROR(UnhexError::NON_HEX_INPUT, unhex("zz"));
    EXPECT_EQ(hex_upper(std::vector<uint8_t>{0x0a, 0xff}), "0AFF");
  }
}  // namespace fcp::common
