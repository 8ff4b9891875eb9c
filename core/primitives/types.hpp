/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace fcp::primitives {
  using ActorId = uint64_t;

  using SectorSize = uint64_t;

  using SectorNumber = uint64_t;

  using DealId = uint64_t;
}  // namespace fcp::primitives
