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
#include <tarput/stream.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>

namespace tarput {

using header_map = std::map<std::string, std::string>;

struct put_options {
    unsigned copies = 2;
    uint64_t size = 0;
    std::string content_type;
    header_map headers;
};

// Hierarchical object store. Paths are absolute, '/'-separated.
//
// put() must report parent_not_directory or directory_does_not_exist before
// it consumes any byte of the body, so the caller can create the parent and
// retry with the same body.
class object_store {
public:
    virtual ~object_store() = default;

    [[nodiscard]] virtual std::expected<void, error> put(
        const std::string& path, input_stream& body, const put_options& options) = 0;

    // Create path and all missing ancestors; succeeds if it already exists
    [[nodiscard]] virtual std::expected<void, error> mkdirp(const std::string& path) = 0;
};

} // namespace tarput
