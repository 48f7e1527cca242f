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

#include <tarput/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace tarput {

// Join an archive entry path onto a store prefix. Leading "./" and "/",
// empty and "." segments are dropped; ".." is rejected.
[[nodiscard]] std::expected<std::string, error> destination_path(
    std::string_view prefix, std::string_view entry_path);

// "/a/b/c" -> "/a/b", "/a" -> "/"
[[nodiscard]] std::string parent_directory(std::string_view path);

// Collapse repeated slashes and drop a trailing slash; "" becomes "/"
[[nodiscard]] std::string normalize_store_path(std::string_view path);

} // namespace tarput
