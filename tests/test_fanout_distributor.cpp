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

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <tarput/tarput.hpp>
#include "recording_store.hpp"
#include "tar_builder.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <numeric>
#include <set>
#include <string>
#include <vector>

using namespace tarput;
using test_support::recording_store;
using test_support::tar_builder;

namespace {

session_config config_for(std::string prefix, size_t parallelism) {
    session_config config;
    config.destination_prefix = std::move(prefix);
    config.parallelism = parallelism;
    return config;
}

std::vector<std::string> uploaded_destinations(const session_report& report) {
    std::vector<std::string> paths;
    for (const auto& upload : report.uploads) {
        if (upload.ok()) {
            paths.push_back(upload.destination);
        }
    }
    std::ranges::sort(paths);
    return paths;
}

uint64_t total_claimed(const session_report& report) {
    return std::accumulate(report.scans.begin(), report.scans.end(), uint64_t{0},
                           [](uint64_t sum, const scan_report& s) { return sum + s.entries_claimed; });
}

} // namespace

TEST_CASE("Files under a new directory", "[integration][fanout_distributor]") {
    memory_entry_source source{tar_builder{}
        .file("a/b.txt", "0123456789")
        .file("a/c.txt", "01234")
        .finish()};
    recording_store store;
    store.set_mkdirp_delay(std::chrono::milliseconds(20));

    auto report = upload_archive(source, store, config_for("/user/stor/out", 3));

    CHECK(report.ok());
    CHECK(report.uploads.size() == 2);
    CHECK(report.succeeded() == 2);
    CHECK(report.bytes_uploaded() == 15);
    CHECK(uploaded_destinations(report) == std::vector<std::string>{"/user/stor/out/a/b.txt", "/user/stor/out/a/c.txt"});
    CHECK(store.mkdirp_requests("/user/stor/out/a") <= 1);
    CHECK(store.max_in_flight() <= 1);
    CHECK(store.inner().object("/user/stor/out/a/b.txt").has_value());
    CHECK(store.inner().object("/user/stor/out/a/c.txt").has_value());
}

TEST_CASE("Archive without payload entries", "[integration][fanout_distributor]") {
    recording_store store;

    SECTION("Directories and empty files only") {
        memory_entry_source source{tar_builder{}
            .directory("empty/")
            .file("empty/zero.txt", "")
            .symlink("link", "empty")
            .finish()};

        auto report = upload_archive(source, store, config_for("/out", 4));

        CHECK(report.ok());
        CHECK(report.uploads.empty());
        CHECK(store.total_put_attempts() == 0);
        CHECK(store.total_mkdirp_requests() == 0);
    }

    SECTION("No entries at all") {
        memory_entry_source source{tar_builder{}.finish()};

        auto report = upload_archive(source, store, config_for("/out", 2));

        CHECK(report.ok());
        CHECK(report.uploads.empty());
        CHECK(report.scans.size() == 2);
    }
}

TEST_CASE("More scanners than entries", "[integration][fanout_distributor]") {
    memory_entry_source source{tar_builder{}
        .file("one.txt", "1")
        .file("two.txt", "22")
        .finish()};
    recording_store store;
    REQUIRE(store.inner().mkdirp("/out").has_value());

    auto report = upload_archive(source, store, config_for("/out", 5));

    CHECK(report.ok());
    CHECK(report.uploads.size() == 2);
    REQUIRE(report.scans.size() == 5);
    CHECK(total_claimed(report) == 2);
    const auto idle = std::ranges::count_if(report.scans, [](const scan_report& s) { return s.entries_claimed == 0; });
    CHECK(idle >= 3);
    for (const auto& scan : report.scans) {
        CHECK(scan.entries_seen == 2);
    }
}

TEST_CASE("Many files discovering the same missing parent", "[integration][fanout_distributor][concurrency]") {
    tar_builder builder;
    for (int i = 0; i < 10; ++i) {
        builder.file("shared/file" + std::to_string(i) + ".dat", std::string(100 + i, 'x'));
    }
    memory_entry_source source{builder.finish()};
    recording_store store;
    store.set_mkdirp_delay(std::chrono::milliseconds(20));

    auto report = upload_archive(source, store, config_for("/bucket", 4));

    CHECK(report.ok());
    CHECK(report.succeeded() == 10);
    CHECK(store.max_in_flight() <= 1);
    CHECK(store.inner().is_directory("/bucket/shared"));
    CHECK(store.inner().object_paths().size() == 10);
}

TEST_CASE("Every entry is claimed exactly once", "[integration][fanout_distributor][concurrency]") {
    const size_t parallelism = GENERATE(1, 2, 3, 4, 5, 6, 7, 8);
    constexpr int entries = 40;

    tar_builder builder;
    std::vector<std::string> expected;
    for (int i = 0; i < entries; ++i) {
        const std::string name = "d" + std::to_string(i % 5) + "/f" + std::to_string(i) + ".txt";
        builder.file(name, std::string(static_cast<size_t>(i + 1), 'a'));
        // Interleave entries that no scanner claims
        if (i % 7 == 0) {
            builder.file("d" + std::to_string(i % 5) + "/empty" + std::to_string(i), "");
            builder.directory("dir" + std::to_string(i) + "/");
        }
        expected.push_back("/out/" + name);
    }
    std::ranges::sort(expected);

    memory_entry_source source{builder.finish()};
    recording_store store;

    auto report = upload_archive(source, store, config_for("/out", parallelism));

    CHECK(report.ok());
    CHECK(report.scans.size() == parallelism);
    CHECK(total_claimed(report) == entries);
    CHECK(uploaded_destinations(report) == expected);
    for (const auto& path : expected) {
        CHECK(store.put_attempts(path) >= 1);
        CHECK(store.put_attempts(path) <= 2);
    }
    CHECK(store.max_in_flight() <= 1);
}

TEST_CASE("Upload failures do not stop the run", "[integration][fanout_distributor]") {
    memory_entry_source source{tar_builder{}
        .file("ok1.txt", "a")
        .file("bad.txt", "b")
        .file("ok2.txt", "c")
        .finish()};
    recording_store store;
    REQUIRE(store.inner().mkdirp("/out").has_value());
    store.on_put([](const std::string& path, size_t) -> std::optional<error> {
        if (path == "/out/bad.txt") {
            return error{error_code::store_error, "rejected"};
        }
        return std::nullopt;
    });

    std::mutex seen_mutex;
    std::vector<std::string> seen;
    auto report = upload_archive(source, store, config_for("/out", 2), [&](const upload_outcome& outcome) {
        std::lock_guard lock(seen_mutex);
        seen.push_back(outcome.entry_path);
    });

    CHECK_FALSE(report.ok());
    CHECK(report.succeeded() == 2);
    CHECK(report.failed() == 1);
    CHECK(seen.size() == 3);
    CHECK(store.put_attempts("/out/bad.txt") == 1);
}

TEST_CASE("Decode errors end the scan", "[integration][fanout_distributor]") {
    auto archive = tar_builder{}.file("good.txt", "fine").unterminated();
    archive.insert(archive.end(), 512, std::byte{'?'});
    archive.insert(archive.end(), 1024, std::byte{0});
    memory_entry_source source{archive};
    recording_store store;

    auto report = upload_archive(source, store, config_for("/out", 3));

    CHECK_FALSE(report.ok());
    CHECK(report.succeeded() == 1);
    REQUIRE(report.scans.size() == 3);
    for (const auto& scan : report.scans) {
        REQUIRE(scan.failure.has_value());
        CHECK(scan.failure->is_decode_error());
    }
}

TEST_CASE("Unreadable archive", "[integration][fanout_distributor]") {
    file_entry_source source{"/nonexistent/archive.tar"};
    recording_store store;

    auto report = upload_archive(source, store, config_for("/out", 2));

    CHECK_FALSE(report.ok());
    CHECK(report.uploads.empty());
    for (const auto& scan : report.scans) {
        REQUIRE(scan.failure.has_value());
        CHECK(scan.failure->code() == error_code::io_error);
    }
}

TEST_CASE("A distributor can run again", "[integration][fanout_distributor]") {
    memory_entry_source source{tar_builder{}
        .file("one.txt", "1")
        .file("two.txt", "22")
        .finish()};
    recording_store store;
    directory_deduplicator directories{store};
    const auto config = config_for("/out", 3);
    upload_dispatcher dispatcher{store, directories, config};
    fanout_distributor distributor{source, dispatcher, config.parallelism};

    auto first = distributor.run();
    CHECK(first.ok());
    CHECK(first.succeeded() == 2);
    CHECK(distributor.claimed() == 2);

    auto second = distributor.run();
    CHECK(second.ok());
    CHECK(second.succeeded() == 2);
    CHECK(total_claimed(second) == 2);
    CHECK(store.put_attempts("/out/one.txt") >= 2);
    CHECK(store.put_attempts("/out/two.txt") >= 2);
}
