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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tarput {

enum class entry_type : char {
    regular_file = '0',
    regular_file_old = '\0',  // Old tar format
    hard_link = '1',
    symbolic_link = '2',
    character_device = '3',
    block_device = '4',
    directory = '5',
    fifo = '6',
    contiguous_file = '7',
    // PAX extensions
    pax_extended_header = 'x',
    pax_global_header = 'g',
    // GNU extensions
    gnu_longname = 'L',
    gnu_longlink = 'K',
    gnu_volhdr = 'V'
};

struct entry_metadata {
    std::filesystem::path path;
    entry_type type = entry_type::regular_file;
    uint64_t size = 0;
    std::optional<std::string> link_target;

    [[nodiscard]] bool is_regular_file() const noexcept {
        return type == entry_type::regular_file ||
               type == entry_type::regular_file_old ||
               type == entry_type::contiguous_file;
    }

    [[nodiscard]] bool is_directory() const noexcept {
        return type == entry_type::directory;
    }

    [[nodiscard]] bool is_gnu_extension() const noexcept {
        return type == entry_type::gnu_longname ||
               type == entry_type::gnu_longlink ||
               type == entry_type::gnu_volhdr;
    }

    [[nodiscard]] bool is_pax_header() const noexcept {
        return type == entry_type::pax_extended_header ||
               type == entry_type::pax_global_header;
    }
};

// POSIX ustar header layout (512 bytes)
struct ustar_header {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];      // "ustar\0"
    char version[2];    // "00"
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(ustar_header) == 512, "POSIX ustar header must be exactly 512 bytes");

} // namespace tarput
