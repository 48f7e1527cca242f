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
#include <tarput/stream.hpp>
#include <tarput/archive_reader.hpp>
#include <tarput/archive_entry.hpp>
#include <tarput/entry_source.hpp>
#include <tarput/object_store.hpp>
#include <tarput/session.hpp>
#include <tarput/fanout_distributor.hpp>

namespace tarput {

// Upload every payload entry of `source` into `store` as configured by
// `config`. `listener`, when set, sees each outcome as it completes.
[[nodiscard]] session_report upload_archive(
    const entry_source& source,
    object_store& store,
    const session_config& config,
    fanout_distributor::upload_listener listener = {});

} // namespace tarput
