/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/blob.hpp"

namespace fcp::common::ffi {
  /// Owns a response allocated by the native library
  template <typename T, typename D>
  auto wrap(T *ptr, D deleter) {
    return std::unique_ptr<T, D>(ptr, deleter);
  }

  template <size_t size>
  auto array(const uint8_t (&rhs)[size]) {
    Blob<size> lhs;
    std::copy(std::begin(rhs), std::end(rhs), std::begin(lhs));
    return lhs;
  }

  template <size_t size>
  void array(uint8_t (&lhs)[size], const std::array<uint8_t, size> &rhs) {
    std::copy(std::begin(rhs), std::end(rhs), std::begin(lhs));
  }
}  // namespace fcp::common::ffi
