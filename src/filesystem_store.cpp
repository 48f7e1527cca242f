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

#include <tarput/filesystem_store.hpp>
#include <tarput/path_utils.hpp>
#include <array>
#include <cerrno>
#include <cstdio>
#include <memory>

namespace tarput {

namespace {

struct file_closer {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

error classify_errno(const std::string& what, const int errnum) {
    switch (errnum) {
        case ENOENT:
            return error{error_code::directory_does_not_exist, what + ": parent directory does not exist"};
        case ENOTDIR:
            return error{error_code::parent_not_directory, what + ": parent is not a directory"};
        default:
            return make_io_error(what, errnum);
    }
}

} // namespace

auto filesystem_store::resolve(const std::string& path) const -> std::expected<std::filesystem::path, error> {
    const std::string normalized = normalize_store_path(path);
    std::filesystem::path relative = std::filesystem::path{normalized}.relative_path();
    for (const auto& segment : relative) {
        if (segment == "..") {
            return std::unexpected(error{error_code::invalid_operation, "Store path escapes the root: " + path});
        }
    }
    return root_ / relative;
}

auto filesystem_store::put(
    const std::string& path, input_stream& body, const put_options& options) -> std::expected<void, error> {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }

    std::error_code ec;
    const auto parent_status = std::filesystem::status(target->parent_path(), ec);
    if (!std::filesystem::exists(parent_status)) {
        return std::unexpected(error{error_code::directory_does_not_exist,
            parent_directory(path) + " does not exist"});
    }
    if (!std::filesystem::is_directory(parent_status)) {
        return std::unexpected(error{error_code::parent_not_directory,
            parent_directory(path) + " is not a directory"});
    }
    if (std::filesystem::is_directory(*target, ec)) {
        return std::unexpected(error{error_code::store_error, path + " is a directory"});
    }

    std::unique_ptr<std::FILE, file_closer> file{std::fopen(target->c_str(), "wb")};
    if (!file) {
        return std::unexpected(classify_errno(path, errno));
    }

    uint64_t written = 0;
    std::array<std::byte, 64 * 1024> chunk{};
    auto copy = [&]() -> std::expected<void, error> {
        for (;;) {
            auto result = body.read(chunk);
            if (!result) {
                return std::unexpected(result.error());
            }
            if (*result == 0) {
                return {};
            }
            if (std::fwrite(chunk.data(), 1, *result, file.get()) != *result) {
                return std::unexpected(make_io_error("Failed to write " + path, errno));
            }
            written += *result;
        }
    };

    auto copied = copy();
    if (copied && std::fclose(file.release()) != 0) {
        copied = std::unexpected(make_io_error("Failed to close " + path, errno));
    }
    if (copied && written != options.size) {
        copied = std::unexpected(error{error_code::store_error,
            path + ": expected " + std::to_string(options.size) + " bytes, received " + std::to_string(written)});
    }

    if (!copied) {
        file.reset();
        std::filesystem::remove(*target, ec);
        return std::unexpected(copied.error());
    }
    return {};
}

auto filesystem_store::mkdirp(const std::string& path) -> std::expected<void, error> {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(*target, ec);
    if (ec) {
        return std::unexpected(classify_errno("Failed to create " + path, ec.value()));
    }
    if (!std::filesystem::is_directory(*target, ec)) {
        return std::unexpected(error{error_code::parent_not_directory, path + " is not a directory"});
    }
    return {};
}

} // namespace tarput
