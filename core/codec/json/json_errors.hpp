/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace fcp::codec::json {
  enum class JsonError {
    kWrongLength = 1,
    kWrongEnum,
    kWrongType,
    kOutOfRange,
    kInvalidJson,
  };
}  // namespace fcp::codec::json

OUTCOME_HPP_DECLARE_ERROR(fcp::codec::json, JsonError);
