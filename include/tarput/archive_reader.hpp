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
#include <tarput/stream.hpp>
#include <tarput/archive_entry.hpp>
#include <tarput/header_parser.hpp>
#include <tarput/gnu_tar.hpp>
#include <tarput/pax_parser.hpp>
#include <array>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>

namespace tarput {

class archive_reader {
private:
    // Position within the current entry's data, shared with its body reader
    struct body_cursor {
        uint64_t remaining = 0;
        uint64_t size = 0;
    };

    std::unique_ptr<input_stream> stream_;
    std::shared_ptr<body_cursor> cursor_;
    bool finished_ = false;
    gnu::gnu_extension_data pending_gnu_extensions_;
    pax::pax_records pending_pax_records_;

    // Read exactly one 512-byte block
    [[nodiscard]] std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> read_block();

    // Skip padding to the next 512-byte boundary
    [[nodiscard]] std::expected<void, error> skip_padding(uint64_t data_size);

    // Skip remaining data and padding of the current entry
    [[nodiscard]] std::expected<void, error> skip_current_entry_data();

    // Returns true when the header was an extension consumed by the reader
    [[nodiscard]] std::expected<bool, error> process_gnu_extension(const entry_metadata& meta);
    [[nodiscard]] std::expected<bool, error> process_pax_header(const entry_metadata& meta);

public:
    explicit archive_reader(std::unique_ptr<input_stream> stream)
        : stream_(std::move(stream)) {}

    [[nodiscard]] static std::expected<archive_reader, error> from_file(const std::filesystem::path& path);
    [[nodiscard]] static std::expected<archive_reader, error> from_stream(std::unique_ptr<input_stream> stream);

    // Get next entry in archive; any unread data of the previous entry is skipped
    [[nodiscard]] std::expected<std::optional<archive_entry>, error> next_entry();

    class iterator {
    private:
        archive_reader* reader_ = nullptr;
        std::optional<archive_entry> current_;
        bool error_occurred_ = false;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = archive_entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const archive_entry*;
        using reference = const archive_entry&;

        iterator() = default;
        explicit iterator(archive_reader* reader) : reader_(reader) {
            ++(*this);
        }

        [[nodiscard]] const archive_entry& operator*() const { return *current_; }
        [[nodiscard]] const archive_entry* operator->() const { return &*current_; }

        iterator& operator++() {
            if (reader_ && !error_occurred_) {
                if (auto result = reader_->next_entry(); result && *result) {
                    current_.emplace(std::move(**result));
                } else {
                    if (!result) {
                        error_occurred_ = true;
                    }
                    reader_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return reader_ == other.reader_;
        }

        [[nodiscard]] bool has_error() const noexcept { return error_occurred_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }
};

} // namespace tarput
