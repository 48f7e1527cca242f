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

#include <tarput/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sstream>

namespace tarput::logging {

namespace {

constexpr const char* default_pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr const char* output_logger_name = "tarput.out";

// An unknown TARPUT_LOG_LEVEL is ignored rather than silencing the logger
std::string resolve_level(const logging_config& config) {
    if (const char* level = std::getenv("TARPUT_LOG_LEVEL"); level && is_valid_level(level)) {
        return level;
    }
    if (is_valid_level(config.level)) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const logging_config& config) {
    if (const char* pattern = std::getenv("TARPUT_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return default_pattern;
}

std::string serialize_fields(std::initializer_list<log_field> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

bool is_valid_level(std::string_view name) {
    return name == "off" || spdlog::level::from_str(std::string{name}) != spdlog::level::off;
}

log_field string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

log_field int_field(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

log_field bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const logging_config& config) {
    spdlog::drop("tarput");
    spdlog::drop(output_logger_name);

    auto logger = spdlog::stderr_color_mt("tarput");
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);

    auto output = spdlog::stdout_logger_mt(output_logger_name);
    output->set_pattern("%v");
    output->set_level(spdlog::level::info);
    output->flush_on(spdlog::level::info);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<log_field> fields) {
    if (!spdlog::should_log(level)) {
        return;
    }
    if (auto serialized = serialize_fields(fields); !serialized.empty()) {
        spdlog::log(level, "{} {}", message, serialized);
        return;
    }
    spdlog::log(level, "{}", message);
}

void print_line(std::string_view line) {
    if (auto output = spdlog::get(output_logger_name)) {
        output->info("{}", line);
        return;
    }
    spdlog::info("{}", line);
}

} // namespace tarput::logging
