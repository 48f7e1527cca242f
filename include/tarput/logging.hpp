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

#include <tarput/session.hpp>
#include <spdlog/common.h>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tarput::logging {

struct log_field {
    std::string key;
    std::string value;
};

log_field string_field(std::string_view key, std::string_view value);
log_field int_field(std::string_view key, std::int64_t value);
log_field bool_field(std::string_view key, bool value);

// True for the names spdlog accepts: trace, debug, info, warn, warning,
// err, error, critical, off
[[nodiscard]] bool is_valid_level(std::string_view name);

// Install the "tarput" diagnostics logger (stderr) and the plain "tarput.out"
// logger used for per-entry operator output (stdout)
void init_logging(const logging_config& config);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<log_field> fields = {});

// One line on stdout, no decoration
void print_line(std::string_view line);

inline void log_debug(std::string_view message, std::initializer_list<log_field> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<log_field> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<log_field> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<log_field> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace tarput::logging

#define TARPUT_LOG_DEBUG(message, ...) ::tarput::logging::log_debug((message), ##__VA_ARGS__)
#define TARPUT_LOG_INFO(message, ...) ::tarput::logging::log_info((message), ##__VA_ARGS__)
#define TARPUT_LOG_WARN(message, ...) ::tarput::logging::log_warn((message), ##__VA_ARGS__)
#define TARPUT_LOG_ERROR(message, ...) ::tarput::logging::log_error((message), ##__VA_ARGS__)
