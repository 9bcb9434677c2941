// Regmock Registration Token Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "../../src/api/token.hpp"

using namespace regmock::api;
using regmock::core::Clock;

TEST_CASE("Base64 encoding", "[token][base64]") {
    const unsigned char hello[] = {'h', 'e', 'l', 'l', 'o'};
    REQUIRE(base64_encode(hello, sizeof(hello)) == "aGVsbG8=");

    const unsigned char zeros[3] = {0, 0, 0};
    REQUIRE(base64_encode(zeros, sizeof(zeros)) == "AAAA");

    REQUIRE(base64_encode(hello, 0).empty());
}

TEST_CASE("Issued token format", "[token]") {
    TokenGenerator generator;
    RegistrationToken token = generator.issue();

    SECTION("carries the mock prefix") {
        REQUIRE(token.token.starts_with(TOKEN_PREFIX));
        REQUIRE(is_mock_token(token.token));
    }

    SECTION("encodes 32 random bytes without newlines") {
        // 32 bytes -> 44 base64 characters
        REQUIRE(token.token.size() == TOKEN_PREFIX.size() + 44);
        REQUIRE(token.token.find('\n') == std::string::npos);
    }
}

TEST_CASE("Tokens are unique across calls", "[token]") {
    TokenGenerator generator;
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        seen.insert(generator.issue().token);
    }
    REQUIRE(seen.size() == 200);
}

TEST_CASE("Token expiry is one TTL after issue", "[token][expiry]") {
    // 2024-01-01T00:00:00Z plus some sub-second noise
    auto now = Clock::from_time_t(1704067200) + std::chrono::milliseconds(750);

    SECTION("default TTL is one hour") {
        TokenGenerator generator;
        REQUIRE(generator.ttl() == std::chrono::hours(1));

        RegistrationToken token = generator.issue(now);
        REQUIRE(token.expires_at == Clock::from_time_t(1704067200 + 3600));
    }

    SECTION("custom TTL") {
        TokenGenerator generator(std::chrono::seconds(90));
        RegistrationToken token = generator.issue(now);
        REQUIRE(token.expires_at == Clock::from_time_t(1704067200 + 90));
    }
}

TEST_CASE("Token JSON shape", "[token][json]") {
    TokenGenerator generator;
    RegistrationToken token = generator.issue(Clock::from_time_t(1704067200));

    nlohmann::json j = token;
    REQUIRE(j.size() == 2);
    REQUIRE(j["token"] == token.token);
    REQUIRE(j["expires_at"] == "2024-01-01T01:00:00Z");
}

TEST_CASE("Mock token recognition", "[token]") {
    REQUIRE(is_mock_token("MOCK_REG_abc"));
    REQUIRE_FALSE(is_mock_token("MOCK_REG_"));
    REQUIRE_FALSE(is_mock_token("mock_reg_abc"));
    REQUIRE_FALSE(is_mock_token("ghp_abc"));
    REQUIRE_FALSE(is_mock_token(""));
}
