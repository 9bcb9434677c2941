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

// Regmock Registration Tokens - Implementation

#include "token.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>

#include <fmt/format.h>

namespace regmock::api {

std::string base64_encode(const unsigned char* data, size_t length) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(b64);
        BIO_free(mem);
        throw TokenGenerationError("BIO allocation failed");
    }
    BIO* bio = BIO_push(b64, mem);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);  // No newlines
    BIO_write(bio, data, static_cast<int>(length));
    (void)BIO_flush(bio);

    // BIO_get_mem_data (OpenSSL 3.x compatible)
    char* encoded_data = nullptr;
    long encoded_length = BIO_get_mem_data(bio, &encoded_data);

    std::string result(encoded_data, static_cast<size_t>(encoded_length));

    BIO_free_all(bio);

    return result;
}

RegistrationToken TokenGenerator::issue(core::Clock::time_point now) const {
    std::array<unsigned char, TOKEN_ENTROPY_BYTES> bytes{};

    // CSPRNG only
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        unsigned long err = ERR_get_error();
        char reason[256];
        ERR_error_string_n(err, reason, sizeof(reason));
        throw TokenGenerationError(fmt::format("secure random source unavailable: {}", reason));
    }

    RegistrationToken token;
    token.token = std::string(TOKEN_PREFIX) + base64_encode(bytes.data(), bytes.size());
    token.expires_at = std::chrono::time_point_cast<std::chrono::seconds>(now) + ttl_;
    return token;
}

bool is_mock_token(std::string_view credential) noexcept {
    return credential.size() > TOKEN_PREFIX.size() && credential.starts_with(TOKEN_PREFIX);
}

}  // namespace regmock::api
