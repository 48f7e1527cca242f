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

#include <tarput/path_utils.hpp>
#include <vector>

namespace tarput {

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        const size_t slash = path.find('/', start);
        const size_t end = slash == std::string_view::npos ? path.size() : slash;
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

} // namespace

std::string normalize_store_path(std::string_view path) {
    std::string result;
    for (const auto segment : split_segments(path)) {
        result += '/';
        result += segment;
    }
    return result.empty() ? std::string{"/"} : result;
}

auto destination_path(std::string_view prefix, std::string_view entry_path) -> std::expected<std::string, error> {
    std::string result = normalize_store_path(prefix);
    if (result == "/") {
        result.clear();
    }

    bool has_name = false;
    for (const auto segment : split_segments(entry_path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            return std::unexpected(error{error_code::invalid_operation,
                "Entry path escapes the destination: " + std::string{entry_path}});
        }
        result += '/';
        result += segment;
        has_name = true;
    }

    if (!has_name) {
        return std::unexpected(error{error_code::invalid_operation,
            "Entry path has no name: '" + std::string{entry_path} + "'"});
    }

    return result;
}

std::string parent_directory(std::string_view path) {
    const std::string normalized = normalize_store_path(path);
    const size_t slash = normalized.rfind('/');
    if (slash == 0 || slash == std::string::npos) {
        return "/";
    }
    return normalized.substr(0, slash);
}

} // namespace tarput
