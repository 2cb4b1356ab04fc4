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

#include <bugsift/send/curl_transport.hpp>
#include <bugsift/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>

namespace bugsift::send {

namespace {

struct curl_easy_deleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct curl_slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct transfer_state {
    CURL* curl = nullptr;
    const body_sink* sink = nullptr;
    http_response* response = nullptr;
    std::optional<error> sink_error;
};

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

size_t on_header(char* data, const size_t size, const size_t count, void* user) {
    auto* state = static_cast<transfer_state*>(user);
    const std::string_view line{data, size * count};
    detail::apply_header_line(*state->response, line);
    return line.size();
}

size_t on_body(char* data, const size_t size, const size_t count, void* user) {
    auto* state = static_cast<transfer_state*>(user);
    const size_t length = size * count;

    long status = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);

    if (state->sink && status >= 200 && status < 300) {
        auto result = (*state->sink)(std::as_bytes(std::span{data, length}));
        if (!result) {
            state->sink_error = result.error();
            return 0;  // Makes curl abort with CURLE_WRITE_ERROR
        }
        return length;
    }

    state->response->body.append(data, length);
    return length;
}

CURLcode global_init() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    return rc;
}

} // anonymous namespace

void detail::apply_header_line(http_response& response, const std::string_view line) {
    if (line.starts_with("HTTP/")) {
        response.headers.clear();
        response.body.clear();
        return;
    }

    if (const auto colon = line.find(':'); colon != std::string_view::npos && colon > 0) {
        response.headers.emplace_back(std::string{trim(line.substr(0, colon))},
                                      std::string{trim(line.substr(colon + 1))});
    }
}

curl_transport::curl_transport(client_options options)
    : options_(std::move(options)) {}

auto curl_transport::get(const http_request &request) -> std::expected<http_response, error> {
    return perform(request, nullptr);
}

auto curl_transport::get_streaming(const http_request &request, const body_sink &sink)
    -> std::expected<http_response, error> {
    return perform(request, &sink);
}

auto curl_transport::perform(const http_request &request, const body_sink *sink)
    -> std::expected<http_response, error> {
    if (const CURLcode rc = global_init(); rc != CURLE_OK) {
        return std::unexpected(error{error_code::transport_error,
            fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc))});
    }

    std::unique_ptr<CURL, curl_easy_deleter> curl{curl_easy_init()};
    if (!curl) {
        return std::unexpected(error{error_code::transport_error, "Failed to create libcurl handle"});
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        const std::string line = fmt::format("{}: {}", name, value);
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_headers);
            return std::unexpected(error{error_code::transport_error, "Failed to build request headers"});
        }
        raw_headers = appended;
    }
    std::unique_ptr<curl_slist, curl_slist_deleter> headers{raw_headers};

    http_response response;
    transfer_state state;
    state.curl = curl.get();
    state.sink = sink;
    state.response = &response;

    char error_buffer[CURL_ERROR_SIZE] = {};

    bool success = true;
    success &= !curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    success &= !curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    success &= !curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    success &= !curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    if (!options_.ca_bundle.empty()) {
        success &= !curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options_.ca_bundle.c_str());
    }

    // curl_easy_setopt is variadic, so the callbacks must be plain function pointers
    success &= !curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &on_header);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &on_body);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);

    if (!success) {
        return std::unexpected(error{error_code::transport_error, "Failed to set libcurl options"});
    }

    logger()->debug("GET {}", request.url);
    const CURLcode rc = curl_easy_perform(curl.get());

    if (state.sink_error) {
        return std::unexpected(std::move(*state.sink_error));
    }
    if (rc != CURLE_OK) {
        const std::string_view detail = error_buffer[0] ? error_buffer : curl_easy_strerror(rc);
        return std::unexpected(error{error_code::transport_error,
            fmt::format("GET {} failed: {}", request.url, detail)});
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    logger()->debug("GET {} -> {}", request.url, response.status);
    return response;
}

} // namespace bugsift::send
