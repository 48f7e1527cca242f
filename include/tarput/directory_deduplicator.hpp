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
#include <tarput/object_store.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tarput {

// Coalesces concurrent directory creation. A path is either absent from the
// pending map (no request in flight) or pending with a non-empty waiter list
// and exactly one mkdirp() outstanding. When the request resolves the entry
// is removed and every waiter is released, in arrival order, with the same
// outcome.
class directory_deduplicator {
public:
    using result_type = std::expected<void, error>;
    using continuation = std::function<void(const result_type&)>;

private:
    object_store& store_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<continuation>> pending_;
    size_t requests_issued_ = 0;

public:
    explicit directory_deduplicator(object_store& store) : store_(store) {}

    directory_deduplicator(const directory_deduplicator&) = delete;
    directory_deduplicator& operator=(const directory_deduplicator&) = delete;

    // Queue `done` on the creation of `path`. The caller that finds the path
    // absent issues the request and runs every continuation on its own
    // thread; later callers return immediately.
    void ensure_directory(const std::string& path, continuation done);

    // Blocking form: waits until the shared request for `path` resolves
    [[nodiscard]] result_type ensure_directory(const std::string& path);

    [[nodiscard]] size_t waiter_count(const std::string& path) const;
    [[nodiscard]] bool is_pending(const std::string& path) const;
    [[nodiscard]] size_t requests_issued() const;
};

} // namespace tarput
