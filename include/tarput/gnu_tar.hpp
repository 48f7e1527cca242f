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
#include <tarput/stream.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace tarput::gnu {

// GNU tar extension data
struct gnu_extension_data {
    std::string longname;     // From 'L' type entries
    std::string longlink;     // From 'K' type entries

    [[nodiscard]] bool has_longname() const noexcept { return !longname.empty(); }
    [[nodiscard]] bool has_longlink() const noexcept { return !longlink.empty(); }

    void clear() {
        longname.clear();
        longlink.clear();
    }
};

// Read an extension body (including block padding) as a string
[[nodiscard]] std::expected<std::string, error> read_gnu_extension_data(
    input_stream& stream,
    uint64_t data_size
);

void apply_gnu_extensions(entry_metadata& metadata, const gnu_extension_data& extensions);

// "ustar  " (old GNU) or "ustar" (POSIX)
[[nodiscard]] bool is_gnu_tar_magic(std::string_view magic);

} // namespace tarput::gnu
