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

#include <tarput/object_store.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace tarput {

struct upload_options {
    unsigned copies = 2;
    header_map headers;
    // Applied to every object; guessed per entry when unset
    std::optional<std::string> content_type;
};

struct logging_config {
    std::string level = "info";
    std::string pattern;
};

struct session_config {
    size_t parallelism = 20;
    std::string destination_prefix;
    upload_options upload;
    logging_config logging;
    std::filesystem::path archive;
    std::filesystem::path store_root = ".";
};

} // namespace tarput
