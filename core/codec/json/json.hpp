/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace fcp::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);

  outcome::result<Bytes> format(const Value &j);
}  // namespace fcp::codec::json
