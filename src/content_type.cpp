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

#include <tarput/content_type.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace tarput {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 32> known_types{{
    {"bz2", "application/x-bzip2"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"md", "text/markdown"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"sh", "application/x-sh"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tgz", "application/gzip"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"ts", "video/mp2t"},
    {"txt", "text/plain"},
    {"wav", "audio/wav"},
    {"webp", "image/webp"},
    {"xml", "application/xml"},
    {"xz", "application/x-xz"},
    {"yaml", "application/yaml"},
    {"yml", "application/yaml"},
    {"zip", "application/zip"},
}};

} // namespace

std::string_view guess_content_type(std::string_view path) noexcept {
    const size_t name_start = path.rfind('/');
    const std::string_view name = name_start == std::string_view::npos ? path : path.substr(name_start + 1);

    const size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return default_content_type;
    }

    const std::string_view extension = name.substr(dot + 1);
    if (extension.size() > 8) {
        return default_content_type;
    }

    std::array<char, 8> lowered{};
    std::ranges::transform(extension, lowered.begin(),
                           [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    const std::string_view key{lowered.data(), extension.size()};

    const auto it = std::ranges::lower_bound(known_types, key, {}, &std::pair<std::string_view, std::string_view>::first);
    if (it != known_types.end() && it->first == key) {
        return it->second;
    }
    return default_content_type;
}

} // namespace tarput
