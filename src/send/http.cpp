/*
 * Copyright 2025 TierOne Software
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

#include <bugsift/send/http.hpp>
#include <algorithm>
#include <cctype>
#include <ranges>

namespace bugsift::send {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

} // anonymous namespace

std::optional<std::string> http_response::header(std::string_view name) const {
    for (const auto& [key, value] : std::views::reverse(headers)) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace bugsift::send
