// Regmock Regex and URL Decoding Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/http/regex.hpp"

using namespace regmock::http;

TEST_CASE("Regex compilation", "[regex]") {
    SECTION("valid pattern compiles") {
        auto re = Regex::compile("^/orgs/([^/]+)/actions/runners$");
        REQUIRE(re.has_value());
        REQUIRE(re->pattern() == "^/orgs/([^/]+)/actions/runners$");
    }

    SECTION("invalid pattern reports an error") {
        std::string error;
        auto re = Regex::compile("^/orgs/([^/]+$", error);
        REQUIRE_FALSE(re.has_value());
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("Anchored route matching", "[regex]") {
    auto re = Regex::compile("^/repos/([^/]+)/([^/]+)/actions/runners$");
    REQUIRE(re.has_value());

    REQUIRE(re->matches("/repos/acme/widgets/actions/runners"));
    REQUIRE_FALSE(re->matches("/repos/acme/widgets/actions/runners/extra"));
    REQUIRE_FALSE(re->matches("/repos/acme/actions/runners"));
    REQUIRE_FALSE(re->matches("/repos//widgets/actions/runners"));
}

TEST_CASE("Capture group extraction", "[regex]") {
    auto re = Regex::compile("^/repos/([^/]+)/([^/]+)/actions/runners/registration-token$");
    REQUIRE(re.has_value());

    auto groups = re->extract_groups("/repos/acme/widgets/actions/runners/registration-token");
    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == "/repos/acme/widgets/actions/runners/registration-token");
    REQUIRE(groups[1] == "acme");
    REQUIRE(groups[2] == "widgets");

    REQUIRE(re->extract_groups("/health").empty());
}

TEST_CASE("Regex is movable", "[regex]") {
    auto re = Regex::compile("^Bearer (ghp_|github_pat_)");
    REQUIRE(re.has_value());

    Regex moved = std::move(*re);
    REQUIRE(moved.matches("Bearer ghp_abc"));
    REQUIRE(moved.matches("Bearer github_pat_abc"));
    REQUIRE_FALSE(moved.matches("Bearer gho_abc"));
}

TEST_CASE("URL path segment decoding", "[regex][url]") {
    SECTION("plain segment is unchanged") {
        REQUIRE(url::decode("acme") == "acme");
    }

    SECTION("percent escapes are decoded") {
        REQUIRE(url::decode("my%20org") == "my org");
        REQUIRE(url::decode("a%2Fb") == "a/b");
        REQUIRE(url::decode("%e2%9c%93") == "\xe2\x9c\x93");
    }

    SECTION("plus is kept literally") {
        REQUIRE(url::decode("a+b") == "a+b");
    }

    SECTION("malformed escapes are rejected") {
        REQUIRE_FALSE(url::decode("bad%").has_value());
        REQUIRE_FALSE(url::decode("bad%2").has_value());
        REQUIRE_FALSE(url::decode("bad%zz").has_value());
    }
}
