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

#include <tarput/upload_dispatcher.hpp>
#include <tarput/content_type.hpp>
#include <tarput/logging.hpp>
#include <tarput/path_utils.hpp>

namespace tarput {

auto upload_dispatcher::options_for(const archive_entry& entry) const -> put_options {
    put_options options;
    options.copies = session_.upload.copies;
    options.size = entry.size();
    options.headers = session_.upload.headers;
    options.content_type = session_.upload.content_type
        ? *session_.upload.content_type
        : std::string{guess_content_type(entry.path().string())};
    return options;
}

auto upload_dispatcher::upload(
    const std::string& destination, entry_body& body, const put_options& options) -> std::expected<void, error> {
    auto result = store_.put(destination, body, options);
    if (result || !result.error().is_missing_parent()) {
        return result;
    }

    // The retry needs the body from its first byte
    if (body.consumed() > 0) {
        return std::unexpected(error{error_code::invalid_operation,
            destination + ": store consumed the body before rejecting it (" + result.error().message() + ")"});
    }

    const std::string parent = parent_directory(destination);
    TARPUT_LOG_DEBUG("parent directory missing",
        {logging::string_field("path", destination), logging::string_field("parent", parent)});

    if (auto created = directories_.ensure_directory(parent); !created) {
        return std::unexpected(created.error());
    }

    TARPUT_LOG_DEBUG("retrying upload", {logging::string_field("path", destination)});
    return store_.put(destination, body, options);
}

auto upload_dispatcher::upload_entry(const archive_entry& entry) -> upload_outcome {
    upload_outcome outcome{entry.path().string(), {}, entry.size(), {}};

    auto destination = destination_path(session_.destination_prefix, outcome.entry_path);
    if (!destination) {
        outcome.result = std::unexpected(destination.error());
        return outcome;
    }
    outcome.destination = std::move(*destination);

    entry_body body{entry};
    outcome.result = upload(outcome.destination, body, options_for(entry));
    return outcome;
}

} // namespace tarput
