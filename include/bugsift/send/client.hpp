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
#include <bugsift/send/http.hpp>
#include <bugsift/send/options.hpp>
#include <bugsift/send/share_link.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bugsift::send {

constexpr std::string_view AUTH_SCHEME = "send-v1";
constexpr unsigned PASSWORD_KDF_ITERATIONS = 100;
constexpr size_t AUTH_KEY_SIZE = 64;

// HMAC-SHA256 key sized to the SHA-256 block. Lives only in memory.
using auth_key = std::array<std::byte, AUTH_KEY_SIZE>;

struct nonce_info {
    std::string nonce;
    bool requires_password = false;
};

// The server hands out a fresh nonce with every authenticated response and
// expects the next request to sign that one. Calls take the current session
// and return the next.
struct auth_session {
    auth_key key{};
    std::string nonce;
};

struct manifest_file {
    std::string name;
    uint64_t size = 0;
};

struct send_manifest {
    std::vector<manifest_file> files;
};

struct send_metadata {
    std::string name;
    std::string type;
    uint64_t size = 0;
    std::optional<send_manifest> manifest;
};

struct metadata_result {
    send_metadata metadata;
    auth_session next;
};

struct download_result {
    std::vector<std::byte> data;
    send_metadata metadata;
};

// Scrape the nonce embedded in the download page
[[nodiscard]] std::expected<nonce_info, error> fetch_nonce(http_transport& transport, const share_locator& locator);

// Password-protected links sign with PBKDF2(password, canonical URL);
// everything else with HKDF(secret, "authentication")
[[nodiscard]] std::expected<auth_key, error> derive_auth_key(
    const share_locator& locator,
    std::string_view canonical_url,
    std::string_view password,
    bool requires_password);

[[nodiscard]] std::expected<std::string, error> build_auth_header(const auth_key& key, std::string_view nonce);

[[nodiscard]] std::expected<metadata_result, error> fetch_metadata(
    http_transport& transport,
    const share_locator& locator,
    const auth_session& session);

// Stream the blob through the content decryptor as it arrives
[[nodiscard]] std::expected<std::vector<std::byte>, error> download_and_decrypt(
    http_transport& transport,
    const share_locator& locator,
    const auth_session& session,
    size_t max_record_size = ECE_DEFAULT_MAX_RECORD_SIZE);

// Nonce, metadata and blob in sequence. The url may still carry shell
// escapes; it is canonicalized first.
[[nodiscard]] std::expected<download_result, error> download_from_send(
    http_transport& transport,
    std::string_view url,
    std::string_view password,
    const client_options& options = {});

// Same, over a libcurl transport built from the options
[[nodiscard]] std::expected<download_result, error> download_from_send(
    std::string_view url,
    std::string_view password,
    const client_options& options = {});

namespace detail {

// Text of the first "downloadMetadata = {...}" object, up to the first ';'
[[nodiscard]] std::optional<std::string> find_download_metadata(std::string_view page);

[[nodiscard]] std::expected<send_metadata, error> parse_metadata_json(std::string_view json);

// WWW-Authenticate value without the scheme tag
[[nodiscard]] std::string strip_auth_scheme(std::string_view value);

} // namespace detail

} // namespace bugsift::send
