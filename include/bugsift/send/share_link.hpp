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
#include <string>
#include <string_view>
#include <vector>

namespace bugsift::send {

// Where a shared file lives and the secret that unlocks it. The secret only
// ever travels in the URL fragment and is never sent to the server.
struct share_locator {
    std::string base_url;               // scheme://host[:port]
    std::string file_id;
    std::vector<std::byte> url_secret;

    [[nodiscard]] std::string download_page_url() const { return base_url + "/download/" + file_id + "/"; }
    [[nodiscard]] std::string metadata_url() const { return base_url + "/api/metadata/" + file_id; }
    [[nodiscard]] std::string blob_url() const { return base_url + "/api/download/blob/" + file_id; }
};

// Undo shell escaping of the fragment marker ("\#" -> "#") as found in links
// copied out of a terminal
[[nodiscard]] std::string canonicalize_share_url(std::string_view raw);

// Parse https://host/download/{id}/#{base64url secret}. The input is
// expected to be canonical already.
[[nodiscard]] std::expected<share_locator, error> parse_share_url(std::string_view url);

// True for characters allowed in a file id
[[nodiscard]] constexpr bool is_file_id_char(const char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

} // namespace bugsift::send
