// Regmock Registry and Service State Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "../../src/api/registry.hpp"
#include "../../src/core/string_utils.hpp"
#include "../../src/core/time_utils.hpp"

using namespace regmock::api;
using regmock::core::Clock;

TEST_CASE("Label splitting", "[registry][labels]") {
    using regmock::core::split;

    REQUIRE(split("", ',').empty());
    REQUIRE(split("self-hosted", ',') == std::vector<std::string>{"self-hosted"});
    REQUIRE(split("self-hosted,linux,x64", ',') ==
            std::vector<std::string>{"self-hosted", "linux", "x64"});

    SECTION("empty entries and whitespace are kept") {
        REQUIRE(split("a,,b", ',') == std::vector<std::string>{"a", "", "b"});
        REQUIRE(split("a, b", ',') == std::vector<std::string>{"a", " b"});
        REQUIRE(split(",", ',') == std::vector<std::string>{"", ""});
    }
}

TEST_CASE("Runner registration", "[registry]") {
    MockRegistry registry("linux", 1000, 99999);
    auto now = Clock::from_time_t(1704067200);

    RegisteredRunner runner = registry.register_runner("runner-01", "self-hosted,linux", now);

    REQUIRE(runner.id >= 1000);
    REQUIRE(runner.id <= 99999);
    REQUIRE(runner.name == "runner-01");
    REQUIRE(runner.os == "linux");
    REQUIRE(runner.status == "online");
    REQUIRE_FALSE(runner.busy);
    REQUIRE(runner.labels == std::vector<std::string>{"self-hosted", "linux"});
    REQUIRE(runner.created_at == now);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Runner list preserves registration order", "[registry]") {
    MockRegistry registry("linux", 1000, 99999);
    registry.register_runner("a", "");
    registry.register_runner("b", "x");
    registry.register_runner("a", "y");  // Duplicate names are separate records

    RunnerList list = registry.list();
    REQUIRE(list.total_count == 3);
    REQUIRE(list.runners.size() == 3);
    REQUIRE(list.runners[0].name == "a");
    REQUIRE(list.runners[0].labels.empty());
    REQUIRE(list.runners[1].name == "b");
    REQUIRE(list.runners[2].name == "a");
}

TEST_CASE("Clearing the registry", "[registry]") {
    MockRegistry registry("linux", 1000, 99999);
    registry.clear();  // No-op when empty
    REQUIRE(registry.size() == 0);

    registry.register_runner("a", "");
    registry.clear();
    REQUIRE(registry.list().total_count == 0);
    REQUIRE(registry.list().runners.empty());
}

TEST_CASE("Degenerate id range yields a fixed id", "[registry]") {
    MockRegistry registry("windows", 4242, 4242);
    REQUIRE(registry.register_runner("w", "").id == 4242);
    REQUIRE(registry.register_runner("w", "").os == "windows");
}

TEST_CASE("Runner JSON shape", "[registry][json]") {
    MockRegistry registry("linux", 1000, 99999);
    auto runner = registry.register_runner("r", "gpu", Clock::from_time_t(1704067200));

    nlohmann::json j = runner;
    REQUIRE(j["id"] == runner.id);
    REQUIRE(j["name"] == "r");
    REQUIRE(j["os"] == "linux");
    REQUIRE(j["status"] == "online");
    REQUIRE(j["busy"] == false);
    REQUIRE(j["labels"] == nlohmann::json::array({"gpu"}));
    REQUIRE(j["created_at"] == "2024-01-01T00:00:00Z");
}

TEST_CASE("Service state reset", "[registry][state]") {
    regmock::control::MockConfig mock;
    ServiceState state(mock);

    state.registry.register_runner("a", "");
    state.request_count = 17;

    state.reset();
    REQUIRE(state.registry.size() == 0);
    REQUIRE(state.request_count == 0);

    state.reset();  // Idempotent
    REQUIRE(state.request_count == 0);
}

TEST_CASE("Service uptime", "[registry][state]") {
    regmock::control::MockConfig mock;
    auto start = Clock::from_time_t(1704067200);
    ServiceState state(mock, start);

    REQUIRE(state.uptime(start).count() == 0);
    REQUIRE(state.uptime(start + std::chrono::milliseconds(1999)).count() == 1);
    REQUIRE(state.uptime(start + std::chrono::hours(26)).count() == 26 * 3600);
}

TEST_CASE("Uptime formatting", "[time]") {
    using regmock::core::format_uptime;
    using std::chrono::seconds;

    REQUIRE(format_uptime(seconds(0)) == "00:00:00");
    REQUIRE(format_uptime(seconds(3661)) == "01:01:01");
    REQUIRE(format_uptime(seconds(86399)) == "23:59:59");
    REQUIRE(format_uptime(seconds(86400 + 7200 + 5)) == "1.02:00:05");
    REQUIRE(format_uptime(seconds(-5)) == "00:00:00");
}

TEST_CASE("ISO-8601 UTC formatting", "[time]") {
    using regmock::core::format_iso8601_utc;

    REQUIRE(format_iso8601_utc(Clock::from_time_t(0)) == "1970-01-01T00:00:00Z");
    REQUIRE(format_iso8601_utc(Clock::from_time_t(1704067200) + std::chrono::milliseconds(999)) ==
            "2024-01-01T00:00:00Z");
}
