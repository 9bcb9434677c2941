#include "regex.hpp"

#include <cstdint>

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace regmock::http {

// Helper to convert error code to string
static std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

namespace {

// Owns match data for a single pcre2_match call
struct MatchData {
    pcre2_match_data* data;

    explicit MatchData(const pcre2_code* code)
        : data(pcre2_match_data_create_from_pattern(code, nullptr)) {}
    ~MatchData() {
        if (data) {
            pcre2_match_data_free(data);
        }
    }

    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;
};

}  // namespace

Regex::Regex(pcre2_real_code_8* code, std::string pattern)
    : code_(code), pattern_(std::move(pattern)) {}

Regex::Regex(Regex&& other) noexcept : code_(other.code_), pattern_(std::move(other.pattern_)) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    if (code_) {
        pcre2_code_free(code_);
    }
}

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string error_message;
    return compile(pattern, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code;
    PCRE2_SIZE error_offset;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                               0,  // options (default)
                               &error_code, &error_offset, nullptr);

    if (!code) {
        error_message = get_pcre2_error(error_code) + " at offset " + std::to_string(error_offset) +
                        " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

bool Regex::matches(std::string_view subject) const {
    MatchData match(code_);
    if (!match.data) {
        return false;
    }

    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         0,  // start offset
                         0,  // options
                         match.data, nullptr);

    return rc >= 0;
}

std::vector<std::string_view> Regex::extract_groups(std::string_view subject) const {
    std::vector<std::string_view> groups;

    MatchData match(code_);
    if (!match.data) {
        return groups;
    }

    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         0,  // start offset
                         0,  // options
                         match.data, nullptr);

    if (rc < 0) {
        return groups;
    }

    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match.data);

    // rc is the number of captured groups + 1 (full match)
    for (int i = 0; i < rc; ++i) {
        PCRE2_SIZE start = ovector[2 * i];
        PCRE2_SIZE end = ovector[2 * i + 1];

        if (start == PCRE2_UNSET) {
            groups.emplace_back();  // Unmatched group
        } else {
            groups.push_back(subject.substr(start, end - start));
        }
    }

    return groups;
}

// URL decoding

namespace url {

static int hex_digit_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::optional<std::string> decode(std::string_view str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%') {
            if (i + 2 >= str.size()) {
                return std::nullopt;  // Incomplete percent sequence
            }

            int high = hex_digit_value(str[i + 1]);
            int low = hex_digit_value(str[i + 2]);

            if (high < 0 || low < 0) {
                return std::nullopt;
            }

            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else {
            decoded += str[i];
        }
    }

    return decoded;
}

}  // namespace url

}  // namespace regmock::http
