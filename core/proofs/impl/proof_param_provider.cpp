/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proofs/proof_param_provider.hpp"

#include <cstdlib>
#include <functional>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include "codec/json/coding.hpp"
#include "codec/json/json.hpp"
#include "common/file.hpp"
#include "common/logger.hpp"

namespace fcp::proofs {
  namespace fs = boost::filesystem;
  namespace json = codec::json;

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("proofs params")};
      return logger;
    }

    constexpr auto kParamDir = "/var/tmp/filecoin-proof-parameters";
    constexpr auto kDirEnv = "FIL_PROOFS_PARAMETER_CACHE";
    constexpr auto kVerifyingKeySuffix = ".vk";

    outcome::result<std::reference_wrapper<const json::Value>> entry(
        const json::Value &j, const char *key) {
      auto it = j.FindMember(key);
      if (it == j.MemberEnd()) {
        return ProofParamProviderError::kMissingEntry;
      }
      return std::cref(it->value);
    }

    outcome::result<ParamFile> readParamFile(const std::string &name,
                                             const json::Value &j) {
      if (!j.IsObject()) {
        return ProofParamProviderError::kInvalidJSON;
      }
      ParamFile param_file;
      param_file.name = name;

      OUTCOME_TRY(cid, entry(j, "cid"));
      OUTCOME_TRYA(param_file.cid, json::decode<std::string>(cid.get()));

      OUTCOME_TRY(digest, entry(j, "digest"));
      OUTCOME_TRYA(param_file.digest, json::decode<std::string>(digest.get()));

      OUTCOME_TRY(sector_size, entry(j, "sector_size"));
      auto size{json::decode<SectorSize>(sector_size.get())};
      if (!size) {
        return ProofParamProviderError::kInvalidSectorSize;
      }
      param_file.sector_size = size.value();

      return param_file;
    }
  }  // namespace

  std::string getParamDir() {
    if (const char *dir = std::getenv(kDirEnv)) {
      return dir;
    }
    return kParamDir;
  }

  outcome::result<std::vector<ParamFile>> readParamsJson(
      const fs::path &path) {
    auto data{common::readFile(path)};
    if (!data) {
      logger()->error(
          "cannot read {}: {}", path.string(), data.error().message());
      return ProofParamProviderError::kFileDoesNotOpen;
    }
    auto document{json::parse(data.value())};
    if (!document || !document.value().IsObject()) {
      return ProofParamProviderError::kInvalidJSON;
    }

    std::vector<ParamFile> result;
    for (const auto &member : document.value().GetObject()) {
      OUTCOME_TRY(param_file,
                  readParamFile({member.name.GetString(),
                                 member.name.GetStringLength()},
                                member.value));
      result.push_back(std::move(param_file));
    }
    return result;
  }

  outcome::result<void> checkVerifyingKeys(gsl::span<const ParamFile> params,
                                           SectorSize sector_size,
                                           const fs::path &dir) {
    size_t checked{0};
    for (const auto &param : params) {
      if (param.sector_size != sector_size
          || !boost::ends_with(param.name, kVerifyingKeySuffix)) {
        continue;
      }
      const auto path{dir / param.name};
      boost::system::error_code ec;
      const auto size{fs::file_size(path, ec)};
      if (ec || size == 0) {
        logger()->error("verifying key {} is missing", path.string());
        return ProofParamProviderError::kMissingFile;
      }
      logger()->debug("verifying key {} found", param.name);
      ++checked;
    }
    if (checked == 0) {
      logger()->error("no verifying keys for sector size {} in manifest",
                      sector_size);
      return ProofParamProviderError::kMissingEntry;
    }
    return outcome::success();
  }
}  // namespace fcp::proofs
