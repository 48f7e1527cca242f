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

/**
 * tarput - Upload the files of a tar archive into an object store.
 *
 * Usage: tarput [options] -f <tar_file> <destination>
 *
 * Every regular file in the archive is written below <destination>; missing
 * directories are created on demand. One line is printed per uploaded object
 * and one error per failed entry. Exit status is non-zero if anything failed.
 */

#include <tarput/config.hpp>
#include <tarput/entry_source.hpp>
#include <tarput/filesystem_store.hpp>
#include <tarput/logging.hpp>
#include <tarput/tarput.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    auto command_line = tarput::config::parse_command_line(argc, argv);
    if (!command_line) {
        std::cerr << argv[0] << ": " << command_line.error().message() << "\n\n"
                  << tarput::config::usage(argv[0]);
        return 2;
    }
    if (command_line->help) {
        std::cout << tarput::config::usage(argv[0]);
        return 0;
    }

    const tarput::session_config& config = command_line->config;
    tarput::logging::init_logging(config.logging);

    tarput::file_entry_source source{config.archive};
    tarput::filesystem_store store{config.store_root};

    auto report = tarput::upload_archive(source, store, config, [](const tarput::upload_outcome& outcome) {
        if (outcome.ok()) {
            tarput::logging::print_line(outcome.destination);
        } else {
            TARPUT_LOG_ERROR("upload failed",
                {tarput::logging::string_field("entry", outcome.entry_path),
                 tarput::logging::string_field("error", outcome.result.error().message())});
        }
    });

    const bool ok = report.ok();
    tarput::logging::shutdown_logging();
    return ok ? 0 : 1;
}
