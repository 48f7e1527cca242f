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

#include <tarput/header_parser.hpp>
#include <tarput/gnu_tar.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <string>
#include <utility>

namespace tarput::detail {

uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    constexpr size_t checksum_offset = offsetof(ustar_header, checksum);
    constexpr size_t checksum_size = sizeof(ustar_header::checksum);

    uint32_t sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= checksum_offset && i < checksum_offset + checksum_size) {
            sum += static_cast<uint8_t>(' ');
        } else {
            sum += static_cast<uint8_t>(block[i]);
        }
    }
    return sum;
}

std::string_view extract_string(std::span<const char> field) {
    const auto null_pos = std::ranges::find(field, '\0');
    const size_t length = null_pos != field.end() ?
        static_cast<size_t>(std::distance(field.begin(), null_pos)) :
        field.size();
    return std::string_view{field.data(), length};
}

bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block) -> std::expected<entry_metadata, error> {
    const auto* header = std::bit_cast<const ustar_header*>(block.data());

    const std::string_view magic = extract_string(std::span{header->magic});
    if (magic != "ustar" && !gnu::is_gnu_tar_magic(magic)) {
        return std::unexpected(error{error_code::invalid_header,
            "Not a POSIX ustar or GNU tar archive (magic: '" + std::string{magic} + "')"});
    }

    auto stored_checksum = parse_numeric(std::span{header->checksum});
    if (!stored_checksum) {
        return std::unexpected(stored_checksum.error());
    }
    if (calculate_checksum(block) != *stored_checksum) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    auto size = parse_numeric(std::span{header->size});
    if (!size) {
        return std::unexpected(error{error_code::invalid_header, "Invalid size field: " + size.error().message()});
    }

    entry_metadata meta;

    // ustar splits long paths into prefix + name; old GNU headers reuse the
    // prefix area for other fields
    const std::string_view name = extract_string(std::span{header->name});
    const std::string_view prefix = magic == "ustar" ? extract_string(std::span{header->prefix}) : std::string_view{};
    if (!prefix.empty()) {
        meta.path = std::string{prefix} + "/" + std::string{name};
    } else {
        meta.path = std::string{name};
    }

    if (meta.path.empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty file path"});
    }

    meta.type = static_cast<entry_type>(header->typeflag);
    meta.size = *size;

    switch (meta.type) {
        case entry_type::regular_file:
        case entry_type::regular_file_old:
        case entry_type::contiguous_file:
        case entry_type::pax_extended_header:
        case entry_type::pax_global_header:
        case entry_type::gnu_longname:
        case entry_type::gnu_longlink:
        case entry_type::gnu_volhdr:
        case entry_type::hard_link:
        case entry_type::symbolic_link:
        case entry_type::character_device:
        case entry_type::block_device:
        case entry_type::directory:
        case entry_type::fifo:
            break;
        default:
            return std::unexpected(error{error_code::unsupported_feature,
                "Unsupported entry type: '" + std::string(1, header->typeflag) + "'"});
    }

    if (meta.type == entry_type::symbolic_link || meta.type == entry_type::hard_link) {
        if (const auto linkname = extract_string(std::span{header->linkname}); !linkname.empty()) {
            meta.link_target = std::string{linkname};
        }
    }

    return meta;
}

} // namespace tarput::detail
