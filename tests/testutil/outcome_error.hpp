/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <gtest/gtest.h>
#include <qtils/outcome.hpp>

namespace testutil {
  /// Checks that `result` failed with exactly `expected`
  template <typename T, typename E>
  ::testing::AssertionResult hasError(const outcome::result<T> &result,
                                      E expected) {
    if (result.has_value()) {
      return ::testing::AssertionFailure() << "succeeded unexpectedly";
    }
    std::error_code expected_code = expected;
    if (result.error() != expected_code) {
      return ::testing::AssertionFailure()
          << "failed with \"" << result.error().message()
          << "\" instead of \"" << expected_code.message() << "\"";
    }
    return ::testing::AssertionSuccess();
  }
}  // namespace testutil
