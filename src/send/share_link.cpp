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

#include <bugsift/send/share_link.hpp>
#include <bugsift/send/crypto.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <optional>

namespace bugsift::send {

namespace {

struct curl_url_deleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

struct curl_string_deleter {
    void operator()(char* str) const { curl_free(str); }
};

// Returns nullopt when the part is absent
std::optional<std::string> url_part(CURLU* handle, const CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || !raw) {
        return std::nullopt;
    }
    std::unique_ptr<char, curl_string_deleter> owned{raw};
    return std::string{owned.get()};
}

// First "/download/<id>" segment in the path, id chars only
std::optional<std::string> find_file_id(std::string_view path) {
    constexpr std::string_view marker = "/download/";

    for (size_t pos = path.find(marker); pos != std::string_view::npos; pos = path.find(marker, pos + 1)) {
        const size_t start = pos + marker.size();
        size_t end = start;
        while (end < path.size() && is_file_id_char(path[end])) {
            ++end;
        }
        if (end > start) {
            return std::string{path.substr(start, end - start)};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::string canonicalize_share_url(std::string_view raw) {
    std::string url;
    url.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '#') {
            continue;
        }
        url.push_back(raw[i]);
    }
    return url;
}

auto parse_share_url(std::string_view url) -> std::expected<share_locator, error> {
    std::unique_ptr<CURLU, curl_url_deleter> handle{curl_url()};
    if (!handle) {
        return std::unexpected(error{error_code::malformed_url, "Failed to allocate URL parser"});
    }

    const std::string owned{url};
    if (const auto rc = curl_url_set(handle.get(), CURLUPART_URL, owned.c_str(), 0); rc != CURLUE_OK) {
        return std::unexpected(error{error_code::malformed_url,
            fmt::format("Invalid share link: {}", curl_url_strerror(rc))});
    }

    const auto scheme = url_part(handle.get(), CURLUPART_SCHEME);
    const auto host = url_part(handle.get(), CURLUPART_HOST);
    if (!scheme || !host) {
        return std::unexpected(error{error_code::malformed_url, "Share link has no scheme or host"});
    }

    share_locator locator;
    locator.base_url = fmt::format("{}://{}", *scheme, *host);
    if (const auto port = url_part(handle.get(), CURLUPART_PORT)) {
        locator.base_url += ":" + *port;
    }

    const auto path = url_part(handle.get(), CURLUPART_PATH).value_or("/");
    auto file_id = find_file_id(path);
    if (!file_id) {
        return std::unexpected(error{error_code::malformed_url,
            fmt::format("Cannot find file id in path '{}'", path)});
    }
    locator.file_id = std::move(*file_id);

    const auto fragment = url_part(handle.get(), CURLUPART_FRAGMENT);
    if (!fragment || fragment->empty()) {
        return std::unexpected(error{error_code::malformed_url, "Share link is missing the secret fragment"});
    }

    auto secret = crypto::base64url_decode(*fragment);
    if (!secret || secret->empty()) {
        return std::unexpected(error{error_code::malformed_url, "Secret fragment is not valid base64url"});
    }
    locator.url_secret = std::move(*secret);

    return locator;
}

} // namespace bugsift::send
