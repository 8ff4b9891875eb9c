/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/cid/cid.hpp"

#include <gtest/gtest.h>

#include "codec/json/json.hpp"
#include "primitives/cid/json_cid.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace fcp {

  /**
   * @given cid v1 bytes
   * @when get raw bytes of decoded cid
   * @then same bytes returned
   */
  TEST(CidTest, RawBytesV1) {
    const auto bytes{
        "017112202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_unhex};
    EXPECT_OUTCOME_TRUE(cid, CID::fromBytes(bytes));
    EXPECT_EQ(cid.version, CID::Version::V1);
    EXPECT_EQ(cid.rawBytes(), bytes);
    EXPECT_OUTCOME_EQ(cid.toBytes(), bytes);
  }

  /**
   * @given cid v0 bytes
   * @when get raw bytes of decoded cid
   * @then multihash bytes returned
   */
  TEST(CidTest, RawBytesV0) {
    const auto bytes{
        "12202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_unhex};
    EXPECT_OUTCOME_TRUE(cid, CID::fromBytes(bytes));
    EXPECT_EQ(cid.version, CID::Version::V0);
    EXPECT_EQ(cid.rawBytes(), bytes);
  }

  /**
   * @given cids differing in codec and in hash
   * @when compare them by bytes
   * @then comparison follows byte order
   */
  TEST(CidTest, BytesLess) {
    const auto a{
        "017112202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_cid};
    const auto b{
        "017112203d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_cid};
    const auto c{
        "015512202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_cid};
    const CidBytesLess less;
    EXPECT_TRUE(less(a, b));
    EXPECT_FALSE(less(b, a));
    EXPECT_FALSE(less(a, a));
    EXPECT_TRUE(less(c, a));
  }

  /**
   * @given cid
   * @when encode it to json and decode back
   * @then cid is an object with "/" string field and decodes to same cid
   */
  TEST(CidTest, Json) {
    const auto cid{
        "017112202d5bb7c3afbe68c05bcd109d890dca28ceb0105bf529ea1111f9ef8b44b217b9"_cid};
    const auto document{codec::json::encode(cid)};
    ASSERT_TRUE(document.IsObject());
    ASSERT_TRUE(document.HasMember("/"));
    EXPECT_OUTCOME_EQ(cid.toString(),
                      std::string{document["/"].GetString()});
    EXPECT_OUTCOME_EQ(codec::json::decode<CID>(document), cid);
  }
}  // namespace fcp
