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
#include <functional>
#include <filesystem>
#include <span>
#include <vector>

namespace tarput {

// Sequential reader over one entry's data; returns 0 once the entry is exhausted
using body_reader_fn = std::function<std::expected<size_t, error>(std::span<std::byte> buffer)>;

class archive_entry {
private:
    entry_metadata metadata_;
    body_reader_fn reader_;

public:
    archive_entry(entry_metadata metadata, body_reader_fn reader)
        : metadata_(std::move(metadata)), reader_(std::move(reader)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return metadata_.path; }
    [[nodiscard]] entry_type type() const noexcept { return metadata_.type; }
    [[nodiscard]] uint64_t size() const noexcept { return metadata_.size; }
    [[nodiscard]] const std::optional<std::string>& link_target() const noexcept { return metadata_.link_target; }

    [[nodiscard]] bool is_regular_file() const noexcept { return metadata_.is_regular_file(); }
    [[nodiscard]] bool is_directory() const noexcept { return metadata_.is_directory(); }

    // Entries that carry a payload worth uploading
    [[nodiscard]] bool has_payload() const noexcept { return is_regular_file() && size() > 0; }

    // Read the next chunk of entry data. Data is only valid while this entry
    // is the reader's current entry.
    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) const;

    [[nodiscard]] const entry_metadata& metadata() const noexcept { return metadata_; }
};

// input_stream view of an entry body, handed to the object store on upload
class entry_body : public input_stream {
private:
    const archive_entry& entry_;
    uint64_t consumed_ = 0;
    bool exhausted_ = false;

public:
    explicit entry_body(const archive_entry& entry) : entry_(entry) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;

    [[nodiscard]] uint64_t consumed() const noexcept { return consumed_; }
    [[nodiscard]] uint64_t size() const noexcept { return entry_.size(); }
};

} // namespace tarput
