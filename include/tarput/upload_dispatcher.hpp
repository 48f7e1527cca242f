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

#include <tarput/archive_entry.hpp>
#include <tarput/directory_deduplicator.hpp>
#include <tarput/error.hpp>
#include <tarput/object_store.hpp>
#include <tarput/session.hpp>
#include <expected>
#include <string>

namespace tarput {

struct upload_outcome {
    std::string entry_path;
    std::string destination;
    uint64_t size = 0;
    std::expected<void, error> result;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

class upload_dispatcher {
private:
    object_store& store_;
    directory_deduplicator& directories_;
    const session_config& session_;

public:
    upload_dispatcher(object_store& store, directory_deduplicator& directories, const session_config& session)
        : store_(store), directories_(directories), session_(session) {}

    // Put `body` at `destination`. A missing parent directory is created
    // through the deduplicator and the put retried exactly once.
    [[nodiscard]] std::expected<void, error> upload(
        const std::string& destination, entry_body& body, const put_options& options);

    // Upload one claimed archive entry below the session's destination prefix
    [[nodiscard]] upload_outcome upload_entry(const archive_entry& entry);

    // Options for one entry: session copies and headers, entry size, and the
    // configured or guessed content type
    [[nodiscard]] put_options options_for(const archive_entry& entry) const;
};

} // namespace tarput
