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
#include <tarput/path_utils.hpp>

using namespace tarput;

TEST_CASE("Destination paths", "[unit][path_utils]") {
    SECTION("Entry joined onto prefix") {
        CHECK(destination_path("/user/stor/out", "a/b.txt") == "/user/stor/out/a/b.txt");
        CHECK(destination_path("/user/stor/out/", "a/b.txt") == "/user/stor/out/a/b.txt");
    }

    SECTION("Leading ./ and / are stripped") {
        CHECK(destination_path("/out", "./a/b.txt") == "/out/a/b.txt");
        CHECK(destination_path("/out", "/a/b.txt") == "/out/a/b.txt");
        CHECK(destination_path("/out", "././a//./b.txt") == "/out/a/b.txt");
    }

    SECTION("Root prefix") {
        CHECK(destination_path("/", "f.txt") == "/f.txt");
        CHECK(destination_path("", "f.txt") == "/f.txt");
    }

    SECTION("Parent references are rejected") {
        auto result = destination_path("/out", "a/../../etc/passwd");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_operation);
    }

    SECTION("Names that reduce to nothing are rejected") {
        CHECK_FALSE(destination_path("/out", "./").has_value());
        CHECK_FALSE(destination_path("/out", "").has_value());
    }
}

TEST_CASE("Parent directories", "[unit][path_utils]") {
    CHECK(parent_directory("/a/b/c") == "/a/b");
    CHECK(parent_directory("/a") == "/");
    CHECK(parent_directory("/") == "/");
    CHECK(parent_directory("/a/b/") == "/a");
}

TEST_CASE("Store path normalization", "[unit][path_utils]") {
    CHECK(normalize_store_path("") == "/");
    CHECK(normalize_store_path("/") == "/");
    CHECK(normalize_store_path("//a///b/") == "/a/b");
    CHECK(normalize_store_path("a/b") == "/a/b");
}
