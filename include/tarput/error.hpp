/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace tarput {

enum class error_code {
    invalid_header,
    corrupt_archive,
    io_error,
    unsupported_feature,
    invalid_operation,
    end_of_archive,
    // Object store failures
    parent_not_directory,
    directory_does_not_exist,
    store_error,
    invalid_configuration
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    // The store rejected a write because the parent directory is missing
    [[nodiscard]] bool is_missing_parent() const noexcept {
        return code_ == error_code::parent_not_directory ||
               code_ == error_code::directory_does_not_exist;
    }

    [[nodiscard]] bool is_decode_error() const noexcept {
        return code_ == error_code::invalid_header ||
               code_ == error_code::corrupt_archive ||
               code_ == error_code::unsupported_feature ||
               code_ == error_code::end_of_archive;
    }

private:
    error_code code_;
    std::string message_;
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

// Errno-based io_error, "<what>: <strerror>"
[[nodiscard]] error make_io_error(std::string_view what, int errnum);

} // namespace tarput
