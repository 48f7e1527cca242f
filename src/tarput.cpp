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

#include <tarput/tarput.hpp>
#include <tarput/directory_deduplicator.hpp>
#include <tarput/logging.hpp>
#include <tarput/upload_dispatcher.hpp>

namespace tarput {

auto upload_archive(
    const entry_source& source,
    object_store& store,
    const session_config& config,
    fanout_distributor::upload_listener listener) -> session_report {
    directory_deduplicator directories{store};
    upload_dispatcher dispatcher{store, directories, config};
    fanout_distributor distributor{source, dispatcher, config.parallelism};
    distributor.on_upload(std::move(listener));

    TARPUT_LOG_DEBUG("starting upload",
        {logging::string_field("destination", config.destination_prefix),
         logging::int_field("parallelism", static_cast<int64_t>(config.parallelism)),
         logging::int_field("copies", static_cast<int64_t>(config.upload.copies))});

    auto report = distributor.run();

    TARPUT_LOG_INFO("upload finished",
        {logging::int_field("uploaded", static_cast<int64_t>(report.succeeded())),
         logging::int_field("failed", static_cast<int64_t>(report.failed())),
         logging::int_field("bytes", static_cast<int64_t>(report.bytes_uploaded())),
         logging::int_field("mkdir_requests", static_cast<int64_t>(directories.requests_issued())),
         logging::bool_field("ok", report.ok())});
    return report;
}

} // namespace tarput
