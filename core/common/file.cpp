/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <fstream>

#include "common/error_text.hpp"
#include "common/span.hpp"

namespace fcp::common {
  outcome::result<Bytes> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary | std::ios::ate};
    if (file.good()) {
      Bytes result;
      result.resize(file.tellg());
      file.seekg(0, std::ios::beg);
      file.read(common::span::string(result).data(),
                static_cast<ptrdiff_t>(result.size()));
      return result;
    }
    return ERROR_TEXT("readFile: cannot open file");
  }
}  // namespace fcp::common
