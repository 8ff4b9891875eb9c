/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <array>
#include <cppcodec/base64_rfc4648.hpp>
#include <gsl/span>
#include <string_view>
#include <vector>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

#define COMMA ,

#define JSON_ENCODE(type)                \
  inline fcp::codec::json::Value encode( \
      const type &v, rapidjson::MemoryPoolAllocator<> &allocator)

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const fcp::codec::json::Value &j)

namespace fcp::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using base64 = cppcodec::base64_rfc4648;

  template <typename T>
  T innerDecode(const Value &j);

  template <typename T>
  inline T kDefaultT() {
    return {};
  }

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  inline std::vector<uint8_t> decodeBase64(const Value &j) {
    if (j.IsNull()) {
      return {};
    }
    try {
      return base64::decode(AsString(j));
    } catch (const cppcodec::parse_error &) {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(int64_t) {
    return Value{v};
  }

  JSON_DECODE(int64_t) {
    if (j.IsInt64()) {
      v = j.GetInt64();
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(uint64_t) {
    return Value{v};
  }

  JSON_DECODE(uint64_t) {
    if (j.IsUint64()) {
      v = j.GetUint64();
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(std::string_view) {
    return {v.data(), static_cast<rapidjson::SizeType>(v.size()), allocator};
  }

  JSON_ENCODE(std::string) {
    return encode(std::string_view{v}, allocator);
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  JSON_ENCODE(gsl::span<const uint8_t>) {
    return encode(base64::encode(v.data(), v.size()), allocator);
  }

  template <size_t N>
  JSON_DECODE(std::array<uint8_t COMMA N>) {
    auto bytes = decodeBase64(j);
    if (bytes.size() != N) {
      outcome::raise(JsonError::kWrongLength);
    }
    std::copy(bytes.begin(), bytes.end(), v.begin());
  }

  JSON_ENCODE(std::vector<uint8_t>) {
    return encode(gsl::make_span(v), allocator);
  }

  JSON_DECODE(std::vector<uint8_t>) {
    v = decodeBase64(j);
  }

  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<T, uint8_t>>>
  JSON_ENCODE(std::vector<T>) {
    Value j{rapidjson::kArrayType};
    j.Reserve(v.size(), allocator);
    for (const auto &elem : v) {
      j.PushBack(encode(elem, allocator), allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::vector<T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsArray()) {
      outcome::raise(JsonError::kWrongType);
    }
    v.reserve(j.Size());

    for (const auto &it : j.GetArray()) {
      v.emplace_back(innerDecode<T>(it));
    }
  }
}  // namespace fcp::codec::json
