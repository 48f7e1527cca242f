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

#include <tarput/stream.hpp>
#include <cerrno>
#include <cstdio>

namespace tarput {

file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + path.string() + " is a directory"});
    }

    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(make_io_error("Failed to open file", errno));
    }

    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            const int saved = errno;
            std::fclose(file);
            return std::unexpected(make_io_error("File seek error", saved));
        }
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(make_io_error("File read error", errno));
    }

    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (file_size_ && position() + bytes > *file_size_) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(make_io_error("File seek error", errno));
    }
    return {};
}

bool file_stream::at_end() const {
    if (file_size_.has_value()) {
        if (const long pos = std::ftell(file_.get()); pos >= 0) {
            return static_cast<size_t>(pos) >= file_size_.value();
        }
    }

    return std::feof(file_.get()) != 0;
}

size_t file_stream::position() const {
    const long pos = std::ftell(file_.get());
    return pos >= 0 ? static_cast<size_t>(pos) : 0;
}

auto file_stream::size() const -> std::optional<size_t> {
    return file_size_;
}

} // namespace tarput
