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

// Regmock Mock Registry - Implementation

#include "registry.hpp"

#include "../core/string_utils.hpp"

namespace regmock::api {

void to_json(nlohmann::json& j, const RegisteredRunner& runner) {
    j = nlohmann::json{{"id", runner.id},
                       {"name", runner.name},
                       {"os", runner.os},
                       {"status", runner.status},
                       {"labels", runner.labels},
                       {"busy", runner.busy},
                       {"created_at", core::format_iso8601_utc(runner.created_at)}};
}

// MockRegistry implementation

MockRegistry::MockRegistry(std::string runner_os, int64_t id_min, int64_t id_max)
    : runner_os_(std::move(runner_os)),
      rng_(std::random_device{}()),
      id_dist_(id_min, id_max) {}

RegisteredRunner MockRegistry::register_runner(std::string name, std::string_view labels_csv,
                                               core::Clock::time_point now) {
    RegisteredRunner runner;
    runner.id = id_dist_(rng_);
    runner.name = std::move(name);
    runner.os = runner_os_;
    runner.status = "online";
    runner.labels = core::split(labels_csv, ',');
    runner.busy = false;
    runner.created_at = now;

    runners_.push_back(runner);
    return runner;
}

RunnerList MockRegistry::list() const {
    return RunnerList{runners_.size(), runners_};
}

void MockRegistry::clear() noexcept {
    runners_.clear();
}

// ServiceState implementation

ServiceState::ServiceState(const control::MockConfig& mock, core::Clock::time_point start)
    : registry(mock.runner_os, mock.runner_id_min, mock.runner_id_max), start_time(start) {}

void ServiceState::reset() noexcept {
    registry.clear();
    request_count = 0;
}

}  // namespace regmock::api
