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

#include <tarput/fanout_distributor.hpp>
#include <tarput/logging.hpp>
#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

namespace tarput {

size_t session_report::succeeded() const noexcept {
    return static_cast<size_t>(std::ranges::count_if(uploads, [](const auto& u) { return u.ok(); }));
}

size_t session_report::failed() const noexcept {
    return uploads.size() - succeeded();
}

uint64_t session_report::bytes_uploaded() const noexcept {
    uint64_t total = 0;
    for (const auto& upload : uploads) {
        if (upload.ok()) {
            total += upload.size;
        }
    }
    return total;
}

bool session_report::ok() const noexcept {
    return failed() == 0 &&
           std::ranges::none_of(scans, [](const auto& s) { return s.failure.has_value(); });
}

void fanout_distributor::record(upload_outcome outcome) {
    if (listener_) {
        listener_(outcome);
    }
    std::lock_guard lock(report_mutex_);
    report_.uploads.push_back(std::move(outcome));
}

auto fanout_distributor::scan(const size_t scanner) -> scan_report {
    scan_report report;
    report.scanner = scanner;

    auto reader = source_.open_scan();
    if (!reader) {
        TARPUT_LOG_ERROR("failed to open archive",
            {logging::int_field("scanner", static_cast<int64_t>(scanner)),
             logging::string_field("error", reader.error().message())});
        report.failure = reader.error();
        return report;
    }

    // Count of payload entries this scanner has passed; identifies the same
    // entry in every scanner because all of them read the same archive
    uint64_t position = 0;

    for (;;) {
        auto next = reader->next_entry();
        if (!next) {
            TARPUT_LOG_ERROR("archive scan failed",
                {logging::int_field("scanner", static_cast<int64_t>(scanner)),
                 logging::int_field("position", static_cast<int64_t>(position)),
                 logging::string_field("error", next.error().message())});
            report.failure = next.error();
            break;
        }
        if (!next->has_value()) {
            break;
        }

        const archive_entry& entry = **next;
        if (!entry.has_payload()) {
            if (entry.link_target()) {
                TARPUT_LOG_DEBUG("skipping link",
                    {logging::string_field("path", entry.path().string()),
                     logging::string_field("target", *entry.link_target())});
            } else {
                TARPUT_LOG_DEBUG("skipping entry",
                    {logging::string_field("path", entry.path().string()),
                     logging::int_field("size", static_cast<int64_t>(entry.size()))});
            }
            continue;
        }

        ++report.entries_seen;
        if (!counter_.try_claim(position++)) {
            continue;
        }

        ++report.entries_claimed;
        TARPUT_LOG_DEBUG("claimed entry",
            {logging::int_field("scanner", static_cast<int64_t>(scanner)),
             logging::int_field("position", static_cast<int64_t>(position - 1)),
             logging::string_field("path", entry.path().string())});

        // Upload before reading on, so this scan never runs ahead of its
        // in-flight body
        record(dispatcher_.upload_entry(entry));
    }

    TARPUT_LOG_DEBUG("scanner finished",
        {logging::int_field("scanner", static_cast<int64_t>(scanner)),
         logging::int_field("seen", static_cast<int64_t>(report.entries_seen)),
         logging::int_field("claimed", static_cast<int64_t>(report.entries_claimed))});
    return report;
}

auto fanout_distributor::run() -> session_report {
    const size_t scanners = std::max<size_t>(parallelism_, 1);
    std::vector<scan_report> scans(scanners);
    size_t started = 0;
    counter_.reset();

    {
        std::vector<std::jthread> threads;
        threads.reserve(scanners);
        for (; started < scanners; ++started) {
            try {
                threads.emplace_back([this, i = started, &scans] { scans[i] = scan(i); });
            } catch (const std::system_error& e) {
                TARPUT_LOG_WARN("failed to start scanner",
                    {logging::int_field("running", static_cast<int64_t>(started)),
                     logging::string_field("error", e.what())});
                break;
            }
        }
    }

    if (started == 0) {
        // Nothing scanned the archive
        scans.front().failure = error{error_code::io_error, "failed to start any scanner thread"};
        scans.resize(1);
    } else {
        // Running scanners claim every entry between them
        scans.resize(started);
    }

    std::lock_guard lock(report_mutex_);
    report_.scans = std::move(scans);
    return std::exchange(report_, session_report{});
}

} // namespace tarput
