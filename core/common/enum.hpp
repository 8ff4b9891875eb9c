/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

namespace fcp::common {
  /// Underlying integer value of enum class, e.g. numeric proof type id
  template <typename Enumeration>
  constexpr auto to_int(Enumeration value) noexcept {
    return static_cast<std::underlying_type_t<Enumeration>>(value);
  }
}  // namespace fcp::common
