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

#include <tarput/error.hpp>
#include <tarput/metadata.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace tarput::detail {

constexpr size_t BLOCK_SIZE = 512;

// Bytes needed to pad data_size up to the next block boundary
[[nodiscard]] constexpr size_t padding_for(uint64_t data_size) noexcept {
    return static_cast<size_t>((BLOCK_SIZE - (data_size % BLOCK_SIZE)) % BLOCK_SIZE);
}

// Parse a numeric header field: NUL/space terminated octal, or GNU base-256
// when the high bit of the first byte is set
template<size_t N>
constexpr std::expected<uint64_t, error> parse_numeric(std::span<const char, N> field) {
    if (!field.empty() && (static_cast<unsigned char>(field[0]) & 0x80) != 0) {
        uint64_t result = static_cast<unsigned char>(field[0]) & 0x7F;
        for (size_t i = 1; i < field.size(); ++i) {
            if (result > (UINT64_MAX >> 8)) {
                return std::unexpected(error{error_code::invalid_header, "Base-256 value overflow"});
            }
            result = (result << 8) | static_cast<unsigned char>(field[i]);
        }
        return result;
    }

    uint64_t result = 0;
    bool found_digit = false;

    for (char c : field) {
        if (c == '\0' || c == ' ') {
            if (!found_digit) continue;
            break;
        }
        if (c < '0' || c > '7') {
            return std::unexpected(error{error_code::invalid_header, "Invalid octal digit"});
        }
        found_digit = true;

        if (result > (UINT64_MAX >> 3)) {
            return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
        }

        result = (result << 3) | static_cast<uint64_t>(c - '0');
    }

    return found_digit ? result : 0;
}

// Sum of all header bytes with the checksum field counted as spaces
[[nodiscard]] uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block);

// Parse a complete tar header block
[[nodiscard]] std::expected<entry_metadata, error> parse_header(std::span<const std::byte, BLOCK_SIZE> block);

// Check if block is all zeros (end-of-archive marker)
[[nodiscard]] bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block);

// Extract a NUL-terminated string from a fixed-size field
[[nodiscard]] std::string_view extract_string(std::span<const char> field);

} // namespace tarput::detail
