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
#include <tarput/session.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tarput::config {

// Upper bound on scanners; each one is a thread holding its own archive handle
inline constexpr size_t max_parallelism = 1024;

// Overlay a YAML configuration file onto `config`
[[nodiscard]] std::expected<void, error> load_yaml_file(session_config& config, const std::filesystem::path& path);

// Same, from YAML text
[[nodiscard]] std::expected<void, error> load_yaml(session_config& config, std::string_view yaml);

// Overlay TARPUT_PARALLEL and TARPUT_COPIES
[[nodiscard]] std::expected<void, error> apply_environment(session_config& config);

// Reject configurations no run can start with
[[nodiscard]] std::expected<void, error> validate(const session_config& config);

// "Name: value" -> {"Name", "value"}
[[nodiscard]] std::expected<std::pair<std::string, std::string>, error> parse_header(std::string_view text);

struct command_line {
    session_config config;
    std::optional<std::filesystem::path> config_file;
    bool verbose = false;
    bool help = false;
};

// Parse argv. Options given on the command line are applied on top of the
// configuration file named by --config or TARPUT_CONFIG and the environment.
[[nodiscard]] std::expected<command_line, error> parse_command_line(int argc, const char* const* argv);

[[nodiscard]] std::string usage(std::string_view program);

} // namespace tarput::config
