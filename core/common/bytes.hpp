/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <vector>

#include "common/cmp.hpp"

namespace fcp {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void copy(Bytes &l, BytesIn r) {
    l.assign(r.begin(), r.end());
  }

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace fcp

namespace gsl {
  inline bool operator==(const fcp::Bytes &l, const fcp::BytesIn &r) {
    return fcp::BytesIn{l} == r;
  }
  inline bool operator==(const fcp::BytesIn &l, const fcp::Bytes &r) {
    return l == fcp::BytesIn{r};
  }
  FCP_OPERATOR_NOT_EQUAL_2(fcp::Bytes, fcp::BytesIn)
  FCP_OPERATOR_NOT_EQUAL_2(fcp::BytesIn, fcp::Bytes)
}  // namespace gsl
