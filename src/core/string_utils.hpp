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

// String Utilities - Splitting, joining and prefix checks

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace regmock::core {

/// Split on a single-character delimiter
/// Empty fields are preserved ("a,,b" -> {"a", "", "b"}) and nothing is trimmed.
/// An empty input yields an empty vector.
[[nodiscard]] inline std::vector<std::string> split(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    if (input.empty()) {
        return parts;
    }

    size_t start = 0;
    while (true) {
        size_t pos = input.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(input.substr(start));
            break;
        }
        parts.emplace_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

/// Join strings with a delimiter
[[nodiscard]] inline std::string join(const std::vector<std::string>& strings,
                                      std::string_view delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::string result = strings[0];
    for (size_t i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

/// Case-sensitive prefix check on the remainder after a scheme ("Bearer ", "RemoteAuth ")
/// Returns the credential part, or an empty view when the scheme does not match
[[nodiscard]] inline std::string_view strip_scheme(std::string_view header,
                                                   std::string_view scheme) noexcept {
    if (header.size() <= scheme.size() || header.substr(0, scheme.size()) != scheme) {
        return {};
    }
    return header.substr(scheme.size());
}

}  // namespace regmock::core
