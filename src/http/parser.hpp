// Regmock HTTP Parser - Header
// Request parser wrapping llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <span>
#include <utility>

namespace regmock::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Request fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// HTTP/1.x request parser (wraps llhttp)
///
/// The listener re-parses the whole receive buffer after each read, so the
/// parser is reset before every call and views always point into the latest
/// buffer contents.
class Parser {
public:
    Parser();
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to ctx_)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Parse HTTP request from buffer
    /// Returns ParseResult and number of bytes consumed
    /// On Complete, 'request' holds views into 'data' and a copy of the body
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(
        std::span<const uint8_t> data,
        Request& request);

    /// Reset parser state for the next request
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;

        std::string_view current_header_field;
        bool message_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

} // namespace regmock::http
