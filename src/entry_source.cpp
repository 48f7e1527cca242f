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

#include <tarput/entry_source.hpp>
#include <tarput/stream.hpp>

namespace tarput {

namespace {

// Keeps the shared archive image alive for as long as the scan's stream
class shared_memory_stream : public memory_stream {
private:
    std::shared_ptr<const std::vector<std::byte>> owner_;

public:
    explicit shared_memory_stream(std::shared_ptr<const std::vector<std::byte>> data)
        : memory_stream(std::span<const std::byte>{*data}), owner_(std::move(data)) {}
};

} // namespace

auto file_entry_source::open_scan() const -> std::expected<archive_reader, error> {
    return archive_reader::from_file(path_);
}

auto memory_entry_source::open_scan() const -> std::expected<archive_reader, error> {
    return archive_reader::from_stream(std::make_unique<shared_memory_stream>(data_));
}

} // namespace tarput
