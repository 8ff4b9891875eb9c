/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "codec/json/json_errors.hpp"
#include "common/span.hpp"

namespace fcp::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kInvalidJson;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    return parse(common::span::bytestr(input));
  }

  outcome::result<Bytes> format(const Value &j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (j.Accept(writer)) {
      std::string_view s{buffer.GetString(), buffer.GetSize()};
      return Bytes(s.begin(), s.end());
    }
    return JsonError::kWrongType;
  }
}  // namespace fcp::codec::json
