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

#include <tarput/archive_reader.hpp>
#include <tarput/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

namespace tarput {

// Produces independent scans of one archive. Every call to open_scan()
// starts a new reader at the beginning of the archive with its own stream
// handle; scans share no decoding state.
class entry_source {
public:
    virtual ~entry_source() = default;

    [[nodiscard]] virtual std::expected<archive_reader, error> open_scan() const = 0;
};

class file_entry_source : public entry_source {
private:
    std::filesystem::path path_;

public:
    explicit file_entry_source(std::filesystem::path path)
        : path_(std::move(path)) {}

    [[nodiscard]] std::expected<archive_reader, error> open_scan() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
};

// Archive image held in memory, shared by all scans
class memory_entry_source : public entry_source {
private:
    std::shared_ptr<const std::vector<std::byte>> data_;

public:
    explicit memory_entry_source(std::vector<std::byte> data)
        : data_(std::make_shared<const std::vector<std::byte>>(std::move(data))) {}

    [[nodiscard]] std::expected<archive_reader, error> open_scan() const override;
};

} // namespace tarput
