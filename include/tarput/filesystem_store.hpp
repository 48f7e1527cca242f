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
#include <filesystem>

namespace tarput {

// Object store backed by a local directory tree. Store path "/a/b" maps to
// <root>/a/b. Only one copy is kept; copies and headers are accepted and
// ignored.
class filesystem_store : public object_store {
private:
    std::filesystem::path root_;

    [[nodiscard]] std::expected<std::filesystem::path, error> resolve(const std::string& path) const;

public:
    explicit filesystem_store(std::filesystem::path root)
        : root_(std::move(root)) {}

    [[nodiscard]] std::expected<void, error> put(
        const std::string& path, input_stream& body, const put_options& options) override;

    [[nodiscard]] std::expected<void, error> mkdirp(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
};

} // namespace tarput
