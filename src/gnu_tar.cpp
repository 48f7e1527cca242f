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

#include <tarput/gnu_tar.hpp>
#include <tarput/header_parser.hpp>
#include <algorithm>
#include <array>
#include <iterator>

namespace tarput::gnu {

// Long names are a few KiB at most; anything bigger is a corrupt header
constexpr uint64_t max_extension_size = 1024 * 1024;

auto read_gnu_extension_data(
    input_stream &stream,
    const uint64_t data_size
) -> std::expected<std::string, error> {
    if (data_size == 0) {
        return std::string{};
    }
    if (data_size > max_extension_size) {
        return std::unexpected(error{error_code::corrupt_archive, "GNU extension data too large"});
    }

    std::string result;
    result.reserve(static_cast<size_t>(data_size));

    uint64_t remaining = data_size;
    std::array<std::byte, detail::BLOCK_SIZE> buffer{};

    while (remaining > 0) {
        const size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, detail::BLOCK_SIZE));

        auto read_result = stream.read(std::span{buffer.data(), to_read});
        if (!read_result) {
            return std::unexpected(read_result.error());
        }

        if (*read_result == 0) {
            return std::unexpected(error{error_code::corrupt_archive,
                "Unexpected end of stream while reading GNU extension data"});
        }

        std::ranges::transform(std::span{buffer.data(), *read_result}, std::back_inserter(result),
                               [](std::byte b) { return static_cast<char>(b); });

        remaining -= *read_result;
    }

    if (const size_t padding = detail::padding_for(data_size); padding > 0) {
        if (auto skip_result = stream.skip(padding); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    // Extension payloads are NUL-terminated
    while (!result.empty() && result.back() == '\0') {
        result.pop_back();
    }

    return result;
}

void apply_gnu_extensions(entry_metadata& metadata, const gnu_extension_data& extensions) {
    if (extensions.has_longname()) {
        metadata.path = extensions.longname;
    }

    if (extensions.has_longlink()) {
        metadata.link_target = extensions.longlink;
    }
}

bool is_gnu_tar_magic(std::string_view magic) {
    return magic == "ustar " || magic == "ustar";
}

} // namespace tarput::gnu
