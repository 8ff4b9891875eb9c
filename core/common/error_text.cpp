/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_text.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace fcp::error_text {
  namespace {
    /**
     * Category of text errors, error value is position of the message in
     * registry plus one
     */
    class TextCategory : public std::error_category {
     public:
      const char *name() const noexcept override {
        return "ErrorText";
      }

      std::string message(int value) const override {
        std::lock_guard lock{mutex_};
        if (value <= 0 || static_cast<size_t>(value) > messages_.size()) {
          return "Unknown error text";
        }
        return messages_[value - 1];
      }

      int add(const char *message) {
        std::lock_guard lock{mutex_};
        // literals are compared by address, ERROR_TEXT caches code per site
        auto it{std::find(messages_.begin(), messages_.end(), message)};
        if (it == messages_.end()) {
          it = messages_.insert(messages_.end(), message);
        }
        return static_cast<int>(it - messages_.begin()) + 1;
      }

     private:
      mutable std::mutex mutex_;
      std::vector<const char *> messages_;
    };

    TextCategory &category() {
      static TextCategory category;
      return category;
    }
  }  // namespace

  std::error_code _make_error_code(const char *message) {
    auto &text_category{category()};
    return {text_category.add(message), text_category};
  }
}  // namespace fcp::error_text
