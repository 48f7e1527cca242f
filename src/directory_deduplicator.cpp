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

#include <tarput/directory_deduplicator.hpp>
#include <tarput/logging.hpp>
#include <future>

namespace tarput {

void directory_deduplicator::ensure_directory(const std::string& path, continuation done) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = pending_.find(path); it != pending_.end()) {
            it->second.push_back(std::move(done));
            TARPUT_LOG_DEBUG("joined pending directory creation",
                {logging::string_field("path", path),
                 logging::int_field("waiters", static_cast<int64_t>(it->second.size()))});
            return;
        }
        pending_[path].push_back(std::move(done));
        ++requests_issued_;
    }

    TARPUT_LOG_DEBUG("creating directory", {logging::string_field("path", path)});
    const result_type outcome = store_.mkdirp(path);
    if (!outcome) {
        TARPUT_LOG_WARN("directory creation failed",
            {logging::string_field("path", path), logging::string_field("error", outcome.error().message())});
    }

    // Waiters that arrive after this point start a fresh request
    std::vector<continuation> waiters;
    {
        std::lock_guard lock(mutex_);
        auto node = pending_.extract(path);
        waiters = std::move(node.mapped());
    }

    for (auto& waiter : waiters) {
        waiter(outcome);
    }
}

auto directory_deduplicator::ensure_directory(const std::string& path) -> result_type {
    std::promise<result_type> promise;
    auto future = promise.get_future();
    ensure_directory(path, [&promise](const result_type& outcome) { promise.set_value(outcome); });
    return future.get();
}

size_t directory_deduplicator::waiter_count(const std::string& path) const {
    std::lock_guard lock(mutex_);
    const auto it = pending_.find(path);
    return it == pending_.end() ? 0 : it->second.size();
}

bool directory_deduplicator::is_pending(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return pending_.contains(path);
}

size_t directory_deduplicator::requests_issued() const {
    std::lock_guard lock(mutex_);
    return requests_issued_;
}

} // namespace tarput
