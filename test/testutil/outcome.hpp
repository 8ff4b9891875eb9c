/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

/**
 * Use these macros in gtest tests to check outcome::result values.
 * EXPECT_OUTCOME_TRUE(val, expr) declares val with the value of expr.
 */

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE(var, val, expr)                               \
  auto &&var = expr;                                                       \
  ASSERT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message(); \
  auto &&val = var.value();

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE_1(var, expr) \
  auto &&var = expr;                      \
  ASSERT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message();

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_FALSE_1(var, expr) \
  auto &&var = expr;                       \
  ASSERT_FALSE(var) << "Line " << __LINE__;

#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr) \
  _EXPECT_OUTCOME_TRUE_1(BOOST_OUTCOME_TRY_UNIQUE_NAME, expr)

#define EXPECT_OUTCOME_FALSE_1(expr) \
  _EXPECT_OUTCOME_FALSE_1(BOOST_OUTCOME_TRY_UNIQUE_NAME, expr)

#define EXPECT_OUTCOME_EQ(expr, expected) \
  {                                       \
    EXPECT_OUTCOME_TRUE(_value, expr);    \
    EXPECT_EQ(_value, expected);          \
  }

#define EXPECT_OUTCOME_ERROR(error, expr)                    \
  {                                                          \
    auto &&_result = expr;                                   \
    ASSERT_TRUE(_result.has_error()) << "Line " << __LINE__; \
    EXPECT_EQ(_result.error(), make_error_code(error));      \
  }
