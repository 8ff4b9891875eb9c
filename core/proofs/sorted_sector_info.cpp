/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/sorted_sector_info.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "codec/json/json.hpp"
#include "proofs/json.hpp"

namespace fcp::proofs {
  namespace json = codec::json;

  namespace {
    template <typename T>
    outcome::result<Bytes> serializeValues(const std::vector<T> &values) {
      try {
        return json::format(json::encode(values));
      } catch (std::system_error &e) {
        return outcome::failure(e.code());
      }
    }

    template <typename T>
    outcome::result<std::vector<T>> deserializeValues(BytesIn input) {
      auto document{json::parse(input)};
      if (!document) {
        return SortedSectorInfoError::kDecodeError;
      }
      if (!document.value().IsArray()) {
        return SortedSectorInfoError::kDecodeError;
      }
      auto values{json::decode<std::vector<T>>(document.value())};
      if (!values) {
        return SortedSectorInfoError::kDecodeError;
      }
      return std::move(values.value());
    }
  }  // namespace

  SortedPublicSectorInfo::SortedPublicSectorInfo(
      std::vector<PublicSectorInfo> values)
      : values_{std::move(values)} {}

  const std::vector<PublicSectorInfo> &SortedPublicSectorInfo::values() const {
    return values_;
  }

  outcome::result<Bytes> SortedPublicSectorInfo::serialize() const {
    return serializeValues(values_);
  }

  outcome::result<SortedPublicSectorInfo> SortedPublicSectorInfo::deserialize(
      BytesIn input) {
    OUTCOME_TRY(values, deserializeValues<PublicSectorInfo>(input));
    return SortedPublicSectorInfo{std::move(values)};
  }

  SortedPrivateSectorInfo::SortedPrivateSectorInfo(
      std::vector<PrivateSectorInfo> values)
      : values_{std::move(values)} {}

  const std::vector<PrivateSectorInfo> &SortedPrivateSectorInfo::values()
      const {
    return values_;
  }

  outcome::result<Bytes> SortedPrivateSectorInfo::serialize() const {
    return serializeValues(values_);
  }

  outcome::result<SortedPrivateSectorInfo> SortedPrivateSectorInfo::deserialize(
      BytesIn input) {
    OUTCOME_TRY(values, deserializeValues<PrivateSectorInfo>(input));
    return SortedPrivateSectorInfo{std::move(values)};
  }

  SortedPublicSectorInfo newSortedPublicSectorInfo(
      gsl::span<const PublicSectorInfo> sector_info) {
    // binary form of each CID is computed once
    std::vector<std::pair<Bytes, const PublicSectorInfo *>> keyed;
    keyed.reserve(sector_info.size());
    for (const auto &info : sector_info) {
      keyed.emplace_back(info.sealed_cid.rawBytes(), &info);
    }
    std::stable_sort(keyed.begin(),
                     keyed.end(),
                     [](const auto &lhs, const auto &rhs) {
                       return lhs.first < rhs.first;
                     });
    std::vector<PublicSectorInfo> values;
    values.reserve(keyed.size());
    for (const auto &entry : keyed) {
      values.push_back(*entry.second);
    }
    return SortedPublicSectorInfo{std::move(values)};
  }

  SortedPrivateSectorInfo newSortedPrivateSectorInfo(
      gsl::span<const PrivateSectorInfo> sector_info) {
    std::vector<PrivateSectorInfo> values;
    values.reserve(sector_info.size());
    for (const auto &info : sector_info) {
      const auto seen{std::any_of(values.begin(),
                                  values.end(),
                                  [&](const PrivateSectorInfo &kept) {
                                    return kept.info.sector
                                           == info.info.sector;
                                  })};
      if (!seen) {
        values.push_back(info);
      }
    }
    if (values.size() > 1) {
      std::stable_sort(
          values.begin(),
          values.end(),
          [](const PrivateSectorInfo &lhs, const PrivateSectorInfo &rhs) {
            return lhs.info.sector < rhs.info.sector;
          });
    }
    return SortedPrivateSectorInfo{std::move(values)};
  }

  outcome::result<SortedPrivateSectorInfo> splitSortedPrivateSectorInfo(
      const SortedPrivateSectorInfo &sorted, int64_t start, int64_t end) {
    const auto size{static_cast<int64_t>(sorted.values_.size())};
    if (start < 0 || end > size || start > end) {
      return SortedSectorInfoError::kRangeError;
    }
    return SortedPrivateSectorInfo{std::vector<PrivateSectorInfo>{
        sorted.values_.begin() + start, sorted.values_.begin() + end}};
  }
}  // namespace fcp::proofs

OUTCOME_CPP_DEFINE_CATEGORY(fcp::proofs, SortedSectorInfoError, e) {
  using fcp::proofs::SortedSectorInfoError;
  switch (e) {
    case SortedSectorInfoError::kDecodeError:
      return "SortedSectorInfo: malformed sector info encoding";
    case SortedSectorInfoError::kRangeError:
      return "SortedSectorInfo: split range is out of bounds";
  }
  return "SortedSectorInfo: unknown error";
}
