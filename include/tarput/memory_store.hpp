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
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tarput {

struct stored_object {
    std::vector<std::byte> data;
    put_options options;
};

// In-memory object store with directory semantics. Only "/" exists
// initially; writes under a missing directory fail with
// directory_does_not_exist, and under an object with parent_not_directory.
class memory_store : public object_store {
private:
    mutable std::mutex mutex_;
    std::set<std::string> directories_{"/"};
    std::map<std::string, stored_object> objects_;
    size_t put_calls_ = 0;
    size_t mkdirp_calls_ = 0;

    [[nodiscard]] std::expected<void, error> check_parent(const std::string& path) const;

public:
    [[nodiscard]] std::expected<void, error> put(
        const std::string& path, input_stream& body, const put_options& options) override;

    [[nodiscard]] std::expected<void, error> mkdirp(const std::string& path) override;

    [[nodiscard]] bool is_directory(const std::string& path) const;
    [[nodiscard]] std::optional<stored_object> object(const std::string& path) const;
    [[nodiscard]] std::vector<std::string> object_paths() const;

    [[nodiscard]] size_t put_calls() const;
    [[nodiscard]] size_t mkdirp_calls() const;
};

} // namespace tarput
