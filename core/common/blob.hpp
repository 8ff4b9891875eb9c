/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>

#include <gsl/span>

#include "common/hexutil.hpp"
#include "common/outcome.hpp"

namespace fcp::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is usually used to store hashes, but it's not appropriate,
   * because it has variable size, while hash of some kind always has fixed
   * size.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    Blob() {
      this->fill(0);
    }

    /**
     * @brief constructor enabling initializer list
     * @param l initializer list
     */
    explicit Blob(const std::array<uint8_t, size_> &l) {
      std::copy(l.begin(), l.end(), this->begin());
    }

    /**
     * In compile-time returns size of current blob.
     */
    static constexpr size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    std::string toHex() const noexcept {
      return hex_lower({this->data(), size_});
    }

    /**
     * Create Blob from arbitrary string, putting its bytes into the blob
     * @param data arbitrary string
     * @return result containing Blob object if string has proper size
     */
    static outcome::result<Blob<size_>> fromString(std::string_view data) {
      if (data.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> b;
      std::copy(data.begin(), data.end(), b.begin());

      return b;
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from span of bytes
     * @param span bytes
     * @return result containing Blob object if span has proper size
     */
    static outcome::result<Blob<size_>> fromSpan(
        const gsl::span<const uint8_t> &span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  // extern declaration of the most frequently instantiated blob
  // specializations, used mostly for Hash instantiation
  extern template class Blob<32ul>;
  extern template class Blob<48ul>;
  extern template class Blob<96ul>;

  // Hash specializations
  using Hash256 = Blob<32>;
}  // namespace fcp::common

namespace fcp {
  using common::Blob;
}  // namespace fcp

OUTCOME_HPP_DECLARE_ERROR(fcp::common, BlobError);
