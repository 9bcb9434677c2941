/*
 * Copyright 2025 Regmock Contributors
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

// Regmock Mock Registry - Header
// In-memory runner records and per-instance service counters

#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../core/time_utils.hpp"

namespace regmock::api {

/// A runner created through the registration flow
struct RegisteredRunner {
    int64_t id = 0;
    std::string name;
    std::string os;
    std::string status = "online";
    std::vector<std::string> labels;
    bool busy = false;
    core::Clock::time_point created_at;
};

void to_json(nlohmann::json& j, const RegisteredRunner& runner);

/// Snapshot returned by MockRegistry::list()
struct RunnerList {
    size_t total_count = 0;
    std::vector<RegisteredRunner> runners;
};

/// Ordered runner store. Not partitioned by org or repo, and names are not
/// unique: registering the same name twice yields two records.
/// Not internally synchronized; ServiceState::mutex guards it.
class MockRegistry {
public:
    MockRegistry(std::string runner_os, int64_t id_min, int64_t id_max);

    /// Append a runner. Labels are split on ',' without trimming.
    RegisteredRunner register_runner(std::string name, std::string_view labels_csv,
                                     core::Clock::time_point now);

    RegisteredRunner register_runner(std::string name, std::string_view labels_csv) {
        return register_runner(std::move(name), labels_csv, core::Clock::now());
    }

    /// Count plus all runners in registration order
    [[nodiscard]] RunnerList list() const;

    /// Remove every runner (no-op when empty)
    void clear() noexcept;

    [[nodiscard]] size_t size() const noexcept { return runners_.size(); }

private:
    std::string runner_os_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<int64_t> id_dist_;
    std::vector<RegisteredRunner> runners_;
};

/// Process-wide mutable state of one service instance.
///
/// Every read or write of registry/request_count must hold `mutex`; the
/// dispatcher takes it once per request, so handlers see a consistent view
/// even in concurrent connection mode.
struct ServiceState {
    explicit ServiceState(const control::MockConfig& mock,
                          core::Clock::time_point start = core::Clock::now());

    // Non-copyable, non-movable (owns a mutex)
    ServiceState(const ServiceState&) = delete;
    ServiceState& operator=(const ServiceState&) = delete;

    /// Clear all runners and zero the request counter (idempotent)
    void reset() noexcept;

    [[nodiscard]] std::chrono::seconds uptime(core::Clock::time_point now) const noexcept {
        return std::chrono::duration_cast<std::chrono::seconds>(now - start_time);
    }

    MockRegistry registry;
    uint64_t request_count = 0;
    const core::Clock::time_point start_time;

    std::mutex mutex;
};

}  // namespace regmock::api
