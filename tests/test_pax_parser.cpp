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
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tarput/pax_parser.hpp>
#include "tar_builder.hpp"
#include <string>

using namespace tarput;
using namespace tarput::pax;
using test_support::to_bytes;

TEST_CASE("parse_pax_headers valid formats", "[unit][pax_parser]") {
    SECTION("Single record") {
        auto bytes = to_bytes("27 path=long/file/name.txt\n");

        auto result = parse_pax_headers(bytes);

        REQUIRE(result.has_value());
        CHECK(result->size() == 1);
        CHECK(result->at("path") == "long/file/name.txt");
    }

    SECTION("Multiple records") {
        auto bytes = to_bytes("27 path=long/file/name.txt\n"
                              "19 size=1234567890\n"
                              "22 mtime=1609459200.5\n");

        auto result = parse_pax_headers(bytes);

        REQUIRE(result.has_value());
        CHECK(result->size() == 3);
        CHECK(result->at("size") == "1234567890");
    }

    SECTION("Value containing '='") {
        auto bytes = to_bytes("17 comment=a=b=c\n");

        auto result = parse_pax_headers(bytes);

        REQUIRE(result.has_value());
        CHECK(result->at("comment") == "a=b=c");
    }

    SECTION("Trailing NUL padding stops parsing") {
        std::string data = "12 path=abc\n";
        data.append(20, '\0');
        auto bytes = to_bytes(data);

        auto result = parse_pax_headers(bytes);

        REQUIRE(result.has_value());
        CHECK(result->at("path") == "abc");
    }
}

TEST_CASE("parse_pax_headers malformed input", "[unit][pax_parser]") {
    SECTION("Missing length") {
        auto result = parse_pax_headers(to_bytes("path=abc\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_header);
    }

    SECTION("Zero length") {
        auto result = parse_pax_headers(to_bytes("0 path=abc\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK_THAT(result.error().message(), Catch::Matchers::ContainsSubstring("cannot be zero"));
    }

    SECTION("Record longer than data") {
        auto result = parse_pax_headers(to_bytes("99 path=abc\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_archive);
    }

    SECTION("Missing separator") {
        auto result = parse_pax_headers(to_bytes("11 pathabc\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK_THAT(result.error().message(), Catch::Matchers::ContainsSubstring("'='"));
    }
}

TEST_CASE("apply_pax_records", "[unit][pax_parser]") {
    entry_metadata meta;
    meta.path = "short";
    meta.size = 3;

    SECTION("Path and size override the header") {
        auto applied = apply_pax_records(meta, {{"path", "a/very/long/path.txt"}, {"size", "4096"}});

        REQUIRE(applied.has_value());
        CHECK(meta.path == "a/very/long/path.txt");
        CHECK(meta.size == 4096);
    }

    SECTION("Unrelated records are ignored") {
        auto applied = apply_pax_records(meta, {{"mtime", "1.5"}, {"SCHILY.xattr.user.a", "b"}});

        REQUIRE(applied.has_value());
        CHECK(meta.path == "short");
        CHECK(meta.size == 3);
    }

    SECTION("Malformed size") {
        auto applied = apply_pax_records(meta, {{"size", "12abc"}});

        REQUIRE_FALSE(applied.has_value());
        CHECK(applied.error().code() == error_code::invalid_header);
    }
}
