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

#include <tarput/archive_reader.hpp>
#include <tarput/stream.hpp>
#include <tarput/pax_parser.hpp>
#include <algorithm>
#include <vector>

namespace tarput {

auto archive_reader::from_file(const std::filesystem::path &path) -> std::expected<archive_reader, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    return archive_reader{std::make_unique<file_stream>(std::move(*stream))};
}

auto archive_reader::from_stream(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    return archive_reader{std::move(stream)};
}

auto archive_reader::read_block() -> std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> {
    std::array<std::byte, detail::BLOCK_SIZE> block{};
    size_t filled = 0;

    while (filled < block.size()) {
        auto result = stream_->read(std::span{block}.subspan(filled));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        filled += *result;
    }

    if (filled != detail::BLOCK_SIZE) {
        if (filled == 0 && stream_->at_end()) {
            return std::unexpected(error{error_code::end_of_archive, "Unexpected end of archive"});
        }
        return std::unexpected(error{error_code::corrupt_archive, "Incomplete block read"});
    }

    return block;
}

auto archive_reader::skip_padding(const uint64_t data_size) -> std::expected<void, error> {
    if (const size_t padding = detail::padding_for(data_size); padding > 0) {
        return stream_->skip(padding);
    }
    return {};
}

auto archive_reader::skip_current_entry_data() -> std::expected<void, error> {
    if (!cursor_) {
        return {};
    }

    // Detach first so stale entries read nothing even if skipping fails
    const auto cursor = std::move(cursor_);
    const uint64_t remaining = cursor->remaining;
    cursor->remaining = 0;

    if (remaining > 0) {
        if (auto skip_result = stream_->skip(static_cast<size_t>(remaining)); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    if (cursor->size > 0) {
        return skip_padding(cursor->size);
    }
    return {};
}

auto archive_reader::next_entry() -> std::expected<std::optional<archive_entry>, error> {
    if (finished_) {
        return std::nullopt;
    }

    if (auto skip_result = skip_current_entry_data(); !skip_result) {
        return std::unexpected(skip_result.error());
    }

    for (;;) {
        auto block_result = read_block();
        if (!block_result) {
            if (block_result.error().code() == error_code::end_of_archive) {
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(block_result.error());
        }

        // End of archive is two zero blocks; tolerate a missing second one at EOF
        if (detail::is_zero_block(*block_result)) {
            auto second_block = read_block();
            if ((second_block && detail::is_zero_block(*second_block)) ||
                (!second_block && second_block.error().code() == error_code::end_of_archive)) {
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(error{error_code::corrupt_archive, "Single zero block in archive"});
        }

        auto metadata_result = detail::parse_header(*block_result);
        if (!metadata_result) {
            return std::unexpected(metadata_result.error());
        }

        if (metadata_result->is_gnu_extension()) {
            auto processed = process_gnu_extension(*metadata_result);
            if (!processed) {
                return std::unexpected(processed.error());
            }
            if (*processed) {
                continue;
            }
        }

        if (metadata_result->is_pax_header()) {
            auto processed = process_pax_header(*metadata_result);
            if (!processed) {
                return std::unexpected(processed.error());
            }
            if (*processed) {
                continue;
            }
        }

        entry_metadata final_metadata = std::move(*metadata_result);
        gnu::apply_gnu_extensions(final_metadata, pending_gnu_extensions_);
        pending_gnu_extensions_.clear();

        if (!pending_pax_records_.empty()) {
            auto applied = pax::apply_pax_records(final_metadata, pending_pax_records_);
            pending_pax_records_.clear();
            if (!applied) {
                return std::unexpected(applied.error());
            }
        }

        cursor_ = std::make_shared<body_cursor>(body_cursor{final_metadata.size, final_metadata.size});

        body_reader_fn reader = [stream = stream_.get(), cursor = cursor_](std::span<std::byte> buffer)
            -> std::expected<size_t, error> {
            const size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), cursor->remaining));
            if (to_read == 0) {
                return size_t{0};
            }

            auto result = stream->read(buffer.first(to_read));
            if (!result) {
                return std::unexpected(result.error());
            }
            if (*result == 0) {
                return std::unexpected(error{error_code::corrupt_archive, "Unexpected end of archive in entry data"});
            }

            cursor->remaining -= *result;
            return *result;
        };

        return archive_entry{std::move(final_metadata), std::move(reader)};
    }
}

auto archive_reader::process_gnu_extension(const entry_metadata &meta) -> std::expected<bool, error> {
    if (meta.type == entry_type::gnu_longname || meta.type == entry_type::gnu_longlink) {
        auto data = gnu::read_gnu_extension_data(*stream_, meta.size);
        if (!data) {
            return std::unexpected(data.error());
        }

        if (meta.type == entry_type::gnu_longname) {
            pending_gnu_extensions_.longname = std::move(*data);
        } else {
            pending_gnu_extensions_.longlink = std::move(*data);
        }
        return true;
    }

    // Volume headers label the archive; nothing to upload
    if (meta.type == entry_type::gnu_volhdr) {
        if (auto skip_result = stream_->skip(static_cast<size_t>(meta.size)); !skip_result) {
            return std::unexpected(skip_result.error());
        }
        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }
        return true;
    }

    return false;
}

auto archive_reader::process_pax_header(const entry_metadata &meta) -> std::expected<bool, error> {
    // Extended headers hold a handful of records; cap to catch corrupt sizes
    constexpr uint64_t max_pax_size = 1024 * 1024;

    if (meta.type == entry_type::pax_extended_header) {
        if (meta.size > max_pax_size) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header data too large"});
        }

        std::vector<std::byte> pax_data(static_cast<size_t>(meta.size));
        size_t filled = 0;
        while (filled < pax_data.size()) {
            auto read_result = stream_->read(std::span{pax_data}.subspan(filled));
            if (!read_result) {
                return std::unexpected(read_result.error());
            }
            if (*read_result == 0) {
                return std::unexpected(error{error_code::corrupt_archive, "Incomplete PAX header data"});
            }
            filled += *read_result;
        }

        auto parse_result = pax::parse_pax_headers(pax_data);
        if (!parse_result) {
            return std::unexpected(parse_result.error());
        }
        pending_pax_records_ = std::move(*parse_result);

        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }
        return true;
    }

    if (meta.type == entry_type::pax_global_header) {
        // Global records carry nothing the upload needs
        if (auto skip_result = stream_->skip(static_cast<size_t>(meta.size)); !skip_result) {
            return std::unexpected(skip_result.error());
        }
        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }
        return true;
    }

    return false;
}

} // namespace tarput
