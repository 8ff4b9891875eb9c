/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include <gsl/span>

#include "common/outcome.hpp"

namespace fcp::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { NOT_ENOUGH_INPUT = 1, NON_HEX_INPUT, UNKNOWN };

  /**
   * @brief Converts bytes to uppercase hex representation
   * @param bytes bytes to convert
   * @return hexencoded string
   */
  std::string hex_upper(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes bytes to convert
   * @return hexencoded string
   */
  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string input
   *
   * @note reads both uppercase and lowercase hexstrings
   *
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);
}  // namespace fcp::common

OUTCOME_HPP_DECLARE_ERROR(fcp::common, UnhexError);
