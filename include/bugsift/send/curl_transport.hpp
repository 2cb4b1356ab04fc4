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

#include <bugsift/send/http.hpp>
#include <bugsift/send/options.hpp>

namespace bugsift::send {

namespace detail {

// Folds one raw header line into the response. A status line starts a new
// response (redirects, 100-continue), dropping earlier headers and body.
void apply_header_line(http_response& response, std::string_view line);

} // namespace detail

// libcurl easy-interface transport. One handle per request; redirects are
// followed.
class curl_transport : public http_transport {
private:
    client_options options_;

    [[nodiscard]] std::expected<http_response, error> perform(const http_request& request, const body_sink* sink);

public:
    explicit curl_transport(client_options options = {});

    [[nodiscard]] std::expected<http_response, error> get(const http_request& request) override;
    [[nodiscard]] std::expected<http_response, error> get_streaming(
        const http_request& request, const body_sink& sink) override;
};

} // namespace bugsift::send
