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

#include <atomic>
#include <cstdint>

namespace tarput {

// Watermark of entries claimed so far, shared by every scanner of one
// upload session. Never decreases.
class claim_counter {
private:
    std::atomic<uint64_t> next_{0};

public:
    claim_counter() = default;
    claim_counter(const claim_counter&) = delete;
    claim_counter& operator=(const claim_counter&) = delete;

    // Claim the entry at `position` (0-based among payload entries). Succeeds
    // only if no scanner has claimed it yet, advancing the watermark to
    // position + 1 in the same atomic step.
    [[nodiscard]] bool try_claim(uint64_t position) noexcept {
        uint64_t expected = position;
        return next_.compare_exchange_strong(expected, position + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire);
    }

    // Start a new session; no scanner may be running
    void reset() noexcept {
        next_.store(0, std::memory_order_release);
    }

    [[nodiscard]] uint64_t claimed() const noexcept {
        return next_.load(std::memory_order_acquire);
    }
};

} // namespace tarput
