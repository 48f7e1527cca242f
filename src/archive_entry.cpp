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

#include <tarput/archive_entry.hpp>
#include <algorithm>
#include <array>

namespace tarput {

auto archive_entry::read(std::span<std::byte> buffer) const -> std::expected<size_t, error> {
    if (!reader_) {
        return std::unexpected(error{error_code::invalid_operation, "Entry has no data reader"});
    }
    return reader_(buffer);
}

auto entry_body::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    if (exhausted_ || buffer.empty()) {
        return 0;
    }

    auto result = entry_.read(buffer);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result == 0) {
        exhausted_ = true;
    }
    consumed_ += *result;
    return *result;
}

auto entry_body::skip(size_t bytes) -> std::expected<void, error> {
    std::array<std::byte, 4096> scratch{};
    while (bytes > 0) {
        auto result = read(std::span{scratch.data(), std::min(bytes, scratch.size())});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::io_error, "Skip past end of entry"});
        }
        bytes -= *result;
    }
    return {};
}

bool entry_body::at_end() const {
    return exhausted_ || consumed_ >= entry_.size();
}

} // namespace tarput
