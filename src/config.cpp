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

#include <tarput/config.hpp>
#include <tarput/logging.hpp>
#include <yaml-cpp/yaml.h>
#include <charconv>
#include <limits>
#include <cstdlib>
#include <string>
#include <vector>

namespace tarput::config {

namespace {

error config_error(std::string message) {
    return error{error_code::invalid_configuration, std::move(message)};
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

template <typename T>
std::expected<T, error> parse_count(std::string_view name, std::string_view text) {
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(config_error(std::string{name} + ": expected a non-negative integer, got '" +
                                            std::string{text} + "'"));
    }
    if (value > std::numeric_limits<T>::max()) {
        return std::unexpected(config_error(std::string{name} + ": value out of range: " + std::string{text}));
    }
    return static_cast<T>(value);
}

std::expected<void, error> apply_yaml(session_config& config, const YAML::Node& root) {
    if (root.IsNull()) {
        return {};
    }
    if (!root.IsMap()) {
        return std::unexpected(config_error("configuration root must be a mapping"));
    }

    for (const auto& item : root) {
        const auto key = item.first.as<std::string>();
        const YAML::Node& value = item.second;

        if (key == "parallelism") {
            auto count = parse_count<size_t>(key, value.as<std::string>());
            if (!count) return std::unexpected(count.error());
            config.parallelism = *count;
        } else if (key == "copies") {
            auto count = parse_count<unsigned>(key, value.as<std::string>());
            if (!count) return std::unexpected(count.error());
            config.upload.copies = *count;
        } else if (key == "destination") {
            config.destination_prefix = value.as<std::string>();
        } else if (key == "archive") {
            config.archive = value.as<std::string>();
        } else if (key == "content_type") {
            config.upload.content_type = value.as<std::string>();
        } else if (key == "headers") {
            if (!value.IsMap()) {
                return std::unexpected(config_error("headers must be a mapping"));
            }
            for (const auto& header : value) {
                config.upload.headers[header.first.as<std::string>()] = header.second.as<std::string>();
            }
        } else if (key == "logging") {
            if (const auto level = value["level"]) config.logging.level = level.as<std::string>();
            if (const auto pattern = value["pattern"]) config.logging.pattern = pattern.as<std::string>();
        } else if (key == "store") {
            if (const auto root_dir = value["root"]) config.store_root = root_dir.as<std::string>();
        } else {
            return std::unexpected(config_error("unknown configuration key '" + key + "'"));
        }
    }

    return {};
}

} // namespace

auto load_yaml(session_config& config, std::string_view yaml) -> std::expected<void, error> {
    try {
        return apply_yaml(config, YAML::Load(std::string{yaml}));
    } catch (const YAML::Exception& e) {
        return std::unexpected(config_error(std::string{"invalid YAML configuration: "} + e.what()));
    }
}

auto load_yaml_file(session_config& config, const std::filesystem::path& path) -> std::expected<void, error> {
    try {
        return apply_yaml(config, YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return std::unexpected(config_error("cannot read configuration file " + path.string()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(config_error("invalid YAML configuration in " + path.string() + ": " + e.what()));
    }
}

auto apply_environment(session_config& config) -> std::expected<void, error> {
    if (const char* parallel = std::getenv("TARPUT_PARALLEL")) {
        auto count = parse_count<size_t>("TARPUT_PARALLEL", parallel);
        if (!count) return std::unexpected(count.error());
        config.parallelism = *count;
    }
    if (const char* copies = std::getenv("TARPUT_COPIES")) {
        auto count = parse_count<unsigned>("TARPUT_COPIES", copies);
        if (!count) return std::unexpected(count.error());
        config.upload.copies = *count;
    }
    return {};
}

auto validate(const session_config& config) -> std::expected<void, error> {
    if (config.parallelism < 1) {
        return std::unexpected(config_error("parallelism must be at least 1"));
    }
    if (config.parallelism > max_parallelism) {
        return std::unexpected(config_error("parallelism must be at most " + std::to_string(max_parallelism) +
                                            ", got " + std::to_string(config.parallelism)));
    }
    if (config.upload.copies < 1) {
        return std::unexpected(config_error("copies must be at least 1"));
    }
    if (config.destination_prefix.empty()) {
        return std::unexpected(config_error("a destination path is required"));
    }
    if (config.destination_prefix.front() != '/') {
        return std::unexpected(config_error("destination must be an absolute path: " + config.destination_prefix));
    }
    if (config.archive.empty()) {
        return std::unexpected(config_error("an archive is required (-f)"));
    }
    if (!logging::is_valid_level(config.logging.level)) {
        return std::unexpected(config_error("unknown log level '" + config.logging.level + "'"));
    }
    return {};
}

auto parse_header(std::string_view text) -> std::expected<std::pair<std::string, std::string>, error> {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(config_error("header must look like 'Name: value': " + std::string{text}));
    }
    const auto name = trim(text.substr(0, colon));
    if (name.empty()) {
        return std::unexpected(config_error("header name is empty: " + std::string{text}));
    }
    return std::pair{std::string{name}, std::string{trim(text.substr(colon + 1))}};
}

auto parse_command_line(const int argc, const char* const* argv) -> std::expected<command_line, error> {
    command_line result;

    std::optional<std::string> archive;
    std::optional<std::string> parallel;
    std::optional<std::string> copies;
    std::optional<std::string> content_type;
    std::optional<std::string> root;
    std::vector<std::string> headers;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::optional<std::string_view> inline_value;

        if (arg.starts_with("--")) {
            if (const auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto take_value = [&]() -> std::expected<std::string, error> {
            if (inline_value) {
                return std::string{*inline_value};
            }
            if (i + 1 >= argc) {
                return std::unexpected(config_error("option " + std::string{arg} + " requires a value"));
            }
            return std::string{argv[++i]};
        };

        auto store_value = [&](std::optional<std::string>& slot) -> std::expected<void, error> {
            auto value = take_value();
            if (!value) return std::unexpected(value.error());
            slot = std::move(*value);
            return {};
        };

        std::expected<void, error> stored;
        if (arg == "-h" || arg == "--help") {
            result.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            result.verbose = true;
        } else if (arg == "-f" || arg == "--file") {
            stored = store_value(archive);
        } else if (arg == "-p" || arg == "--parallel") {
            stored = store_value(parallel);
        } else if (arg == "-c" || arg == "--copies") {
            stored = store_value(copies);
        } else if (arg == "-t" || arg == "--type") {
            stored = store_value(content_type);
        } else if (arg == "-r" || arg == "--root") {
            stored = store_value(root);
        } else if (arg == "--config") {
            std::optional<std::string> path;
            stored = store_value(path);
            if (path) result.config_file = *path;
        } else if (arg == "-H" || arg == "--header") {
            auto value = take_value();
            if (!value) return std::unexpected(value.error());
            headers.push_back(std::move(*value));
        } else if (arg.size() > 1 && arg.front() == '-') {
            return std::unexpected(config_error("unknown option " + std::string{arg}));
        } else {
            positional.emplace_back(arg);
        }

        if (!stored) {
            return std::unexpected(stored.error());
        }
    }

    if (result.help) {
        return result;
    }

    session_config& config = result.config;

    if (!result.config_file) {
        if (const char* env_config = std::getenv("TARPUT_CONFIG")) {
            result.config_file = env_config;
        }
    }
    if (result.config_file) {
        if (auto loaded = load_yaml_file(config, *result.config_file); !loaded) {
            return std::unexpected(loaded.error());
        }
    }

    if (auto env = apply_environment(config); !env) {
        return std::unexpected(env.error());
    }

    if (positional.size() > 1) {
        return std::unexpected(config_error("expected a single destination, got " + std::to_string(positional.size())));
    }
    if (!positional.empty()) {
        config.destination_prefix = positional.front();
    }
    if (archive) {
        config.archive = *archive;
    }
    if (parallel) {
        auto count = parse_count<size_t>("--parallel", *parallel);
        if (!count) return std::unexpected(count.error());
        config.parallelism = *count;
    }
    if (copies) {
        auto count = parse_count<unsigned>("--copies", *copies);
        if (!count) return std::unexpected(count.error());
        config.upload.copies = *count;
    }
    if (content_type) {
        config.upload.content_type = *content_type;
    }
    if (root) {
        config.store_root = *root;
    }
    for (const auto& header : headers) {
        auto parsed = parse_header(header);
        if (!parsed) return std::unexpected(parsed.error());
        config.upload.headers[parsed->first] = parsed->second;
    }
    if (result.verbose) {
        config.logging.level = "debug";
    }

    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return result;
}

std::string usage(std::string_view program) {
    std::string text = "Usage: " + std::string{program} + " [options] -f ARCHIVE DESTINATION\n";
    text +=
        "\n"
        "Upload every file in a tar archive below DESTINATION.\n"
        "\n"
        "Options:\n"
        "  -f, --file PATH        archive to upload\n"
        "  -p, --parallel N       number of concurrent scanners (default 20)\n"
        "  -c, --copies N         copies to keep of each object (default 2)\n"
        "  -H, --header 'K: V'    add a header to every object (repeatable)\n"
        "  -t, --type TYPE        content type for every object (default: by extension)\n"
        "  -r, --root DIR         root directory of the object store (default .)\n"
        "      --config PATH      YAML configuration file (or TARPUT_CONFIG)\n"
        "  -v, --verbose          debug logging\n"
        "  -h, --help             show this help\n";
    return text;
}

} // namespace tarput::config
