/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

// intentionally here, so users can use fs shortcut
namespace fs = boost::filesystem;

namespace test {

  /**
   * @brief Fixture owning a directory under the system temp directory,
   * e.g. a parameter cache. Directory is recreated before and removed after
   * each test.
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(const fs::path &path);

    ~BaseFS_Test() override;

    /**
     * @brief Delete directory and all containing files
     */
    void clear();

    /**
     * @brief Create testing directory
     */
    void mkdir();

    /**
     * @brief Get test directory path
     */
    std::string getPathString() const;

    /**
     * @brief Create file in test directory
     * @param filename is a name of created file
     * @param content is written to the file
     * @return full pathname to the new file
     */
    fs::path createFile(const fs::path &filename,
                        const std::string &content = {}) const;

    /**
     * @brief path exists
     * @param entity - file or directory to check
     */
    bool exists(const fs::path &entity) const;

    void SetUp() override;

    void TearDown() override;

   protected:
    fs::path base_path;
  };

}  // namespace test
