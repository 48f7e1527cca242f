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

#include <tarput/pax_parser.hpp>
#include <algorithm>
#include <charconv>

namespace tarput::pax {

auto parse_pax_headers(
    const std::span<const std::byte> data) -> std::expected<pax_records, error> {
    pax_records result;

    const auto start = reinterpret_cast<const char*>(data.data());
    const char* end = start + data.size();
    const char* pos = start;

    while (pos < end && *pos != '\0') {
        const char* length_start = pos;
        while (pos < end && *pos >= '0' && *pos <= '9') {
            ++pos;
        }

        if (pos == length_start || pos >= end || *pos != ' ') {
            return std::unexpected(error{error_code::invalid_header,
                "Invalid PAX header length field, found: '" + std::string(length_start, std::min(pos, end)) + "'"});
        }

        size_t length = 0;
        if (std::from_chars(length_start, pos, length).ec != std::errc{}) {
            return std::unexpected(error{error_code::invalid_header, "Failed to parse PAX header length"});
        }
        if (length == 0) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record length cannot be zero"});
        }

        ++pos; // Skip space

        const char* record_end = length_start + length;
        if (length > static_cast<size_t>(end - length_start)) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record extends beyond data"});
        }
        if (record_end <= pos) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record too short"});
        }

        const char* key_start = pos;
        const char* value_end = record_end;
        if (*(value_end - 1) == '\n') {
            --value_end;
        }

        const char* equals_pos = std::find(key_start, value_end, '=');
        if (equals_pos == value_end) {
            return std::unexpected(error{error_code::invalid_header, "PAX header missing '=' separator"});
        }

        result[std::string(key_start, equals_pos)] = std::string(equals_pos + 1, value_end);

        pos = record_end;
    }

    return result;
}

auto apply_pax_records(entry_metadata& metadata, const pax_records& records) -> std::expected<void, error> {
    if (const auto path_it = records.find("path"); path_it != records.end() && !path_it->second.empty()) {
        metadata.path = path_it->second;
    }

    if (const auto link_it = records.find("linkpath"); link_it != records.end() && !link_it->second.empty()) {
        metadata.link_target = link_it->second;
    }

    if (const auto size_it = records.find("size"); size_it != records.end()) {
        uint64_t pax_size = 0;
        const auto& value = size_it->second;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), pax_size);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::unexpected(error{error_code::invalid_header, "Invalid PAX size record: '" + value + "'"});
        }
        metadata.size = pax_size;
    }

    return {};
}

} // namespace tarput::pax
