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

#pragma once

#include <bugsift/error.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bugsift::send {

using header_list = std::vector<std::pair<std::string, std::string>>;

struct http_request {
    std::string url;
    header_list headers;
};

struct http_response {
    long status = 0;
    header_list headers;
    std::string body;   // Empty for streamed successful responses

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }

    // Case-insensitive lookup of the last header with this name
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

// Receives response body bytes as they arrive
using body_sink = std::function<std::expected<void, error>(std::span<const std::byte>)>;

// Blocking HTTP GET. Network failures are error_code::transport_error;
// any HTTP status, including 4xx and 5xx, is a successful response.
class http_transport {
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual std::expected<http_response, error> get(const http_request& request) = 0;

    // For 2xx responses the body goes to the sink and response.body stays
    // empty; other responses are buffered so they can be reported. A sink
    // error aborts the transfer and is returned unchanged.
    [[nodiscard]] virtual std::expected<http_response, error> get_streaming(
        const http_request& request, const body_sink& sink) = 0;
};

} // namespace bugsift::send
