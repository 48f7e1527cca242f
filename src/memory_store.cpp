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

#include <tarput/memory_store.hpp>
#include <tarput/path_utils.hpp>
#include <array>

namespace tarput {

auto memory_store::check_parent(const std::string& path) const -> std::expected<void, error> {
    const std::string parent = parent_directory(path);
    if (directories_.contains(parent)) {
        return {};
    }

    // Any ancestor that is an object makes the path unreachable
    for (std::string ancestor = parent; ancestor != "/"; ancestor = parent_directory(ancestor)) {
        if (objects_.contains(ancestor)) {
            return std::unexpected(error{error_code::parent_not_directory,
                ancestor + " is not a directory"});
        }
    }

    return std::unexpected(error{error_code::directory_does_not_exist,
        parent + " does not exist"});
}

auto memory_store::put(
    const std::string& path, input_stream& body, const put_options& options) -> std::expected<void, error> {
    const std::string key = normalize_store_path(path);
    {
        std::lock_guard lock(mutex_);
        ++put_calls_;
        if (auto parent = check_parent(key); !parent) {
            return std::unexpected(parent.error());
        }
        if (directories_.contains(key)) {
            return std::unexpected(error{error_code::store_error, key + " is a directory"});
        }
    }

    stored_object object{{}, options};
    std::array<std::byte, 16 * 1024> chunk{};
    for (;;) {
        auto result = body.read(chunk);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        object.data.insert(object.data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*result));
    }

    if (object.data.size() != options.size) {
        return std::unexpected(error{error_code::store_error,
            key + ": expected " + std::to_string(options.size) + " bytes, received " +
            std::to_string(object.data.size())});
    }

    std::lock_guard lock(mutex_);
    objects_.insert_or_assign(key, std::move(object));
    return {};
}

auto memory_store::mkdirp(const std::string& path) -> std::expected<void, error> {
    const std::string key = normalize_store_path(path);

    std::lock_guard lock(mutex_);
    ++mkdirp_calls_;

    std::vector<std::string> missing;
    for (std::string dir = key; !directories_.contains(dir); dir = parent_directory(dir)) {
        if (objects_.contains(dir)) {
            return std::unexpected(error{error_code::parent_not_directory, dir + " is not a directory"});
        }
        missing.push_back(dir);
    }

    directories_.insert(missing.begin(), missing.end());
    return {};
}

bool memory_store::is_directory(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return directories_.contains(normalize_store_path(path));
}

auto memory_store::object(const std::string& path) const -> std::optional<stored_object> {
    std::lock_guard lock(mutex_);
    if (const auto it = objects_.find(normalize_store_path(path)); it != objects_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> memory_store::object_paths() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(objects_.size());
    for (const auto& [path, object] : objects_) {
        paths.push_back(path);
    }
    return paths;
}

size_t memory_store::put_calls() const {
    std::lock_guard lock(mutex_);
    return put_calls_;
}

size_t memory_store::mkdirp_calls() const {
    std::lock_guard lock(mutex_);
    return mkdirp_calls_;
}

} // namespace tarput
