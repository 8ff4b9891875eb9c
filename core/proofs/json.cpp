/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/json.hpp"

#include "codec/json/json.hpp"

namespace fcp::proofs {
  outcome::result<AggregateSealVerifyProofAndInfos>
  decodeAggregateSealVerifyProofAndInfos(BytesIn input) {
    auto document{codec::json::parse(input)};
    if (!document) {
      return SortedSectorInfoError::kDecodeError;
    }
    auto aggregate{
        codec::json::decode<AggregateSealVerifyProofAndInfos>(document.value())};
    if (!aggregate) {
      return SortedSectorInfoError::kDecodeError;
    }
    return std::move(aggregate.value());
  }
}  // namespace fcp::proofs
