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
#include <tarput/upload_dispatcher.hpp>
#include "recording_store.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <string>

using namespace tarput;
using test_support::recording_store;

namespace {

// Entry backed by a string, readable once like an archive body
archive_entry make_entry(std::string path, std::string content) {
    auto data = std::make_shared<std::string>(std::move(content));
    auto offset = std::make_shared<size_t>(0);
    entry_metadata metadata;
    metadata.path = std::move(path);
    metadata.type = entry_type::regular_file;
    metadata.size = data->size();
    return archive_entry{std::move(metadata), [data, offset](std::span<std::byte> buffer) -> std::expected<size_t, error> {
        const size_t n = std::min(buffer.size(), data->size() - *offset);
        std::memcpy(buffer.data(), data->data() + *offset, n);
        *offset += n;
        return n;
    }};
}

std::string stored_text(const memory_store& store, const std::string& path) {
    auto object = store.object(path);
    if (!object) {
        return {};
    }
    std::string text;
    for (auto b : object->data) {
        text.push_back(static_cast<char>(b));
    }
    return text;
}

error missing_parent(const std::string& path) {
    return error{error_code::directory_does_not_exist, path + ": parent missing"};
}

} // namespace

TEST_CASE("Upload with an existing parent", "[unit][upload_dispatcher]") {
    recording_store store;
    REQUIRE(store.inner().mkdirp("/dest").has_value());
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    upload_dispatcher dispatcher{store, directories, session};

    auto outcome = dispatcher.upload_entry(make_entry("hello.txt", "hello"));

    CHECK(outcome.ok());
    CHECK(outcome.destination == "/dest/hello.txt");
    CHECK(outcome.size == 5);
    CHECK(stored_text(store.inner(), "/dest/hello.txt") == "hello");
    CHECK(store.put_attempts("/dest/hello.txt") == 1);
    CHECK(store.total_mkdirp_requests() == 0);
}

TEST_CASE("Missing parent is created and the upload retried once", "[unit][upload_dispatcher]") {
    recording_store store;
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    upload_dispatcher dispatcher{store, directories, session};

    SECTION("Retry succeeds") {
        auto outcome = dispatcher.upload_entry(make_entry("a/b/c.txt", "payload"));

        CHECK(outcome.ok());
        CHECK(store.put_attempts("/dest/a/b/c.txt") == 2);
        CHECK(store.mkdirp_requests("/dest/a/b") == 1);
        CHECK(store.inner().is_directory("/dest/a"));
        CHECK(stored_text(store.inner(), "/dest/a/b/c.txt") == "payload");
    }

    SECTION("Retry failure is final") {
        store.on_put([](const std::string& path, size_t attempt) -> std::optional<error> {
            if (attempt == 2) {
                return error{error_code::parent_not_directory, path + ": still missing"};
            }
            return std::nullopt;
        });

        auto outcome = dispatcher.upload_entry(make_entry("x/y.txt", "data"));

        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.result.error().code() == error_code::parent_not_directory);
        CHECK(store.put_attempts("/dest/x/y.txt") == 2);
        CHECK(store.mkdirp_requests("/dest/x") == 1);
    }

    SECTION("Directory creation failure is final") {
        store.on_mkdirp([](const std::string&) -> std::optional<error> {
            return error{error_code::store_error, "permission denied"};
        });

        auto outcome = dispatcher.upload_entry(make_entry("x/y.txt", "data"));

        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.result.error().code() == error_code::store_error);
        CHECK(outcome.result.error().message() == "permission denied");
        CHECK(store.put_attempts("/dest/x/y.txt") == 1);
    }
}

TEST_CASE("Other failures are not retried", "[unit][upload_dispatcher]") {
    recording_store store;
    REQUIRE(store.inner().mkdirp("/dest").has_value());
    store.on_put([](const std::string&, size_t) -> std::optional<error> {
        return error{error_code::store_error, "service unavailable"};
    });
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    upload_dispatcher dispatcher{store, directories, session};

    auto outcome = dispatcher.upload_entry(make_entry("f.txt", "x"));

    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.result.error().code() == error_code::store_error);
    CHECK(store.put_attempts("/dest/f.txt") == 1);
    CHECK(store.total_mkdirp_requests() == 0);
}

TEST_CASE("A consumed body is not retried", "[unit][upload_dispatcher]") {
    // Reads part of the body and then reports a missing parent
    class greedy_store : public memory_store {
    public:
        size_t puts = 0;
        std::expected<void, error> put(const std::string& path, input_stream& body, const put_options&) override {
            ++puts;
            std::array<std::byte, 2> scratch{};
            (void)body.read(scratch);
            return std::unexpected(missing_parent(path));
        }
    };

    greedy_store store;
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    upload_dispatcher dispatcher{store, directories, session};

    auto outcome = dispatcher.upload_entry(make_entry("f.txt", "abcdef"));

    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.result.error().code() == error_code::invalid_operation);
    CHECK(store.puts == 1);
    CHECK(store.mkdirp_calls() == 0);
}

TEST_CASE("Upload options", "[unit][upload_dispatcher]") {
    recording_store store;
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    session.upload.copies = 3;
    session.upload.headers["Cache-Control"] = "max-age=60";
    upload_dispatcher dispatcher{store, directories, session};

    SECTION("Content type is guessed from the entry name") {
        auto entry = make_entry("img/logo.PNG", "png");
        auto options = dispatcher.options_for(entry);
        CHECK(options.content_type == "image/png");
        CHECK(options.copies == 3);
        CHECK(options.size == 3);
        CHECK(options.headers.at("Cache-Control") == "max-age=60");
    }

    SECTION("Configured content type wins") {
        session.upload.content_type = "text/x-custom";
        auto options = dispatcher.options_for(make_entry("img/logo.png", "png"));
        CHECK(options.content_type == "text/x-custom");
    }

    SECTION("Stored objects carry the options") {
        REQUIRE(dispatcher.upload_entry(make_entry("doc/readme.md", "# hi")).ok());
        auto object = store.inner().object("/dest/doc/readme.md");
        REQUIRE(object.has_value());
        CHECK(object->options.copies == 3);
        CHECK(object->options.content_type == "text/markdown");
        CHECK(object->options.headers.at("Cache-Control") == "max-age=60");
    }
}

TEST_CASE("Entry paths that escape the destination", "[unit][upload_dispatcher]") {
    recording_store store;
    directory_deduplicator directories{store};
    session_config session;
    session.destination_prefix = "/dest";
    upload_dispatcher dispatcher{store, directories, session};

    auto outcome = dispatcher.upload_entry(make_entry("../etc/passwd", "root"));

    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.result.error().code() == error_code::invalid_operation);
    CHECK(store.total_put_attempts() == 0);
}
