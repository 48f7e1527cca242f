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

#include <tarput/memory_store.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

// memory_store decorator that records calls, tracks how many mkdirp()
// requests per path are in flight, and lets tests inject failures or delays
class recording_store : public tarput::object_store {
public:
    using put_hook = std::function<std::optional<tarput::error>(const std::string& path, size_t attempt)>;
    using mkdirp_hook = std::function<std::optional<tarput::error>(const std::string& path)>;

private:
    tarput::memory_store inner_;
    mutable std::mutex mutex_;
    std::map<std::string, size_t> put_attempts_;
    std::map<std::string, size_t> mkdirp_requests_;
    std::map<std::string, size_t> in_flight_;
    size_t max_in_flight_ = 0;
    put_hook put_hook_;
    mkdirp_hook mkdirp_hook_;
    std::chrono::milliseconds mkdirp_delay_{0};

public:
    void on_put(put_hook hook) { put_hook_ = std::move(hook); }
    void on_mkdirp(mkdirp_hook hook) { mkdirp_hook_ = std::move(hook); }
    void set_mkdirp_delay(std::chrono::milliseconds delay) { mkdirp_delay_ = delay; }

    std::expected<void, tarput::error> put(
        const std::string& path, tarput::input_stream& body, const tarput::put_options& options) override {
        size_t attempt = 0;
        {
            std::lock_guard lock(mutex_);
            attempt = ++put_attempts_[path];
        }
        if (put_hook_) {
            if (auto failure = put_hook_(path, attempt)) {
                return std::unexpected(*failure);
            }
        }
        return inner_.put(path, body, options);
    }

    std::expected<void, tarput::error> mkdirp(const std::string& path) override {
        {
            std::lock_guard lock(mutex_);
            ++mkdirp_requests_[path];
            const size_t now = ++in_flight_[path];
            max_in_flight_ = std::max(max_in_flight_, now);
        }

        if (mkdirp_delay_.count() > 0) {
            std::this_thread::sleep_for(mkdirp_delay_);
        }

        std::expected<void, tarput::error> result;
        if (mkdirp_hook_) {
            if (auto failure = mkdirp_hook_(path)) {
                result = std::unexpected(*failure);
            }
        }
        if (result) {
            result = inner_.mkdirp(path);
        }

        std::lock_guard lock(mutex_);
        --in_flight_[path];
        return result;
    }

    [[nodiscard]] size_t put_attempts(const std::string& path) const {
        std::lock_guard lock(mutex_);
        const auto it = put_attempts_.find(path);
        return it == put_attempts_.end() ? 0 : it->second;
    }

    [[nodiscard]] size_t total_put_attempts() const {
        std::lock_guard lock(mutex_);
        size_t total = 0;
        for (const auto& [path, count] : put_attempts_) total += count;
        return total;
    }

    [[nodiscard]] size_t mkdirp_requests(const std::string& path) const {
        std::lock_guard lock(mutex_);
        const auto it = mkdirp_requests_.find(path);
        return it == mkdirp_requests_.end() ? 0 : it->second;
    }

    [[nodiscard]] size_t total_mkdirp_requests() const {
        std::lock_guard lock(mutex_);
        size_t total = 0;
        for (const auto& [path, count] : mkdirp_requests_) total += count;
        return total;
    }

    [[nodiscard]] size_t max_in_flight() const {
        std::lock_guard lock(mutex_);
        return max_in_flight_;
    }

    [[nodiscard]] tarput::memory_store& inner() { return inner_; }
};

} // namespace test_support
