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

#include <tarput/claim_counter.hpp>
#include <tarput/entry_source.hpp>
#include <tarput/error.hpp>
#include <tarput/upload_dispatcher.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace tarput {

struct scan_report {
    size_t scanner = 0;
    uint64_t entries_seen = 0;   // payload entries read by this scanner
    uint64_t entries_claimed = 0;
    std::optional<error> failure;
};

struct session_report {
    std::vector<upload_outcome> uploads;
    std::vector<scan_report> scans;

    [[nodiscard]] size_t succeeded() const noexcept;
    [[nodiscard]] size_t failed() const noexcept;
    [[nodiscard]] uint64_t bytes_uploaded() const noexcept;
    [[nodiscard]] bool ok() const noexcept;
};

// Runs `parallelism` scanners over the same archive. Each scanner reads the
// archive from the start and claims the next payload entry nobody else has
// claimed; everything else it skips. The claim watermark is the only state
// shared between scanners.
class fanout_distributor {
public:
    // Invoked once per finished upload, from the scanner's thread
    using upload_listener = std::function<void(const upload_outcome&)>;

private:
    const entry_source& source_;
    upload_dispatcher& dispatcher_;
    size_t parallelism_;
    claim_counter counter_;
    upload_listener listener_;

    std::mutex report_mutex_;
    session_report report_;

    [[nodiscard]] scan_report scan(size_t scanner);
    void record(upload_outcome outcome);

public:
    fanout_distributor(const entry_source& source, upload_dispatcher& dispatcher, size_t parallelism)
        : source_(source), dispatcher_(dispatcher), parallelism_(parallelism) {}

    void on_upload(upload_listener listener) { listener_ = std::move(listener); }

    // Scan and upload to completion; individual failures do not stop the run.
    // Each call is a fresh session over the whole archive.
    [[nodiscard]] session_report run();

    [[nodiscard]] uint64_t claimed() const noexcept { return counter_.claimed(); }
};

} // namespace tarput
