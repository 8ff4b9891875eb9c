/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

/// Rejects anything but a compile-time string
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _ERROR_TEXT_CONST(s)     \
  [] {                           \
    constexpr const char *_s{s}; \
    return _s;                   \
  }()
/**
 * Error code whose message is the given literal, e.g.
 * `return ERROR_TEXT("applyProofsConfig: parameter cache is not set");`
 * Code is created once per call site.
 */
#define ERROR_TEXT(s)                                              \
  [] {                                                             \
    static const std::error_code ec{                               \
        ::fcp::error_text::_make_error_code(_ERROR_TEXT_CONST(s))}; \
    return ec;                                                     \
  }()

namespace fcp::error_text {
  /// Registers message in text category, use ERROR_TEXT instead
  std::error_code _make_error_code(const char *message);
}  // namespace fcp::error_text
