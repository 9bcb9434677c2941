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

// Regmock HTTP Parser - Implementation

#include "parser.hpp"

namespace regmock::http {

Parser::Parser() {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::parse_request(
    std::span<const uint8_t> data,
    Request& request) {

    ctx_.request = &request;
    ctx_.message_complete = false;
    ctx_.error = HPE_OK;

    llhttp_errno_t err = llhttp_execute(
        &parser_,
        reinterpret_cast<const char*>(data.data()),
        data.size());

    size_t consumed = data.size();

    // HPE_PAUSED is returned when on_message_complete stops after one request
    if (err != HPE_OK && err != HPE_PAUSED) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(error_pos) - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    return {ParseResult::Incomplete, consumed};
}

void Parser::reset() {
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
    ctx_ = Context{};
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = false;
    if (ctx->request) {
        ctx->request->body.clear();
    }
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->request->uri = std::string_view(at, length);

    // Split path and query
    size_t query_pos = ctx->request->uri.find('?');
    if (query_pos != std::string_view::npos) {
        ctx->request->path = ctx->request->uri.substr(0, query_pos);
        ctx->request->query = ctx->request->uri.substr(query_pos + 1);
    } else {
        ctx->request->path = ctx->request->uri;
        ctx->request->query = {};
    }

    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->current_header_field = std::string_view(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->request->headers.push_back(Header{ctx->current_header_field,
                                           std::string_view(at, length)});
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    uint8_t major = parser->http_major;
    uint8_t minor = parser->http_minor;
    if (major == 1 && minor == 0) {
        ctx->request->version = Version::HTTP_1_0;
    } else if (major == 1 && minor == 1) {
        ctx->request->version = Version::HTTP_1_1;
    } else {
        ctx->request->version = Version::UNKNOWN;
    }

    switch (llhttp_get_method(parser)) {
        case HTTP_GET: ctx->request->method = Method::GET; break;
        case HTTP_POST: ctx->request->method = Method::POST; break;
        case HTTP_PUT: ctx->request->method = Method::PUT; break;
        case HTTP_DELETE: ctx->request->method = Method::DELETE; break;
        case HTTP_HEAD: ctx->request->method = Method::HEAD; break;
        case HTTP_OPTIONS: ctx->request->method = Method::OPTIONS; break;
        case HTTP_PATCH: ctx->request->method = Method::PATCH; break;
        default: ctx->request->method = Method::UNKNOWN; break;
    }

    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // Chunked bodies arrive in pieces separated by framing bytes
    ctx->request->body.append(at, length);

    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;
    // One request per connection; ignore anything pipelined after it
    return HPE_PAUSED;
}

} // namespace regmock::http
