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

#include <bugsift/send/client.hpp>
#include <bugsift/send/crypto.hpp>
#include <bugsift/send/curl_transport.hpp>
#include <bugsift/send/ece.hpp>
#include <bugsift/log.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>

namespace bugsift::send {

namespace {

constexpr std::string_view METADATA_KEY_INFO = "metadata";
constexpr std::string_view AUTH_KEY_INFO = "authentication";

// Map a non-2xx status to the error the caller should see. Rejected
// authentication on a signed request means the handshake no longer matches
// what the server expects.
error status_error(const http_response& response, std::string_view what, const bool authenticated) {
    const auto code = [&] {
        if (response.status == 404) {
            return error_code::not_found;
        }
        if (authenticated && (response.status == 401 || response.status == 403)) {
            return error_code::protocol_mismatch;
        }
        return error_code::transport_error;
    }();

    std::string body = response.body.substr(0, 200);
    return error{code, fmt::format("{} failed with HTTP {}{}{}", what, response.status,
                                   body.empty() ? "" : ": ", body)};
}

std::expected<YAML::Node, error> load_json(std::string_view text, std::string_view what) {
    try {
        YAML::Node root = YAML::Load(std::string{text});
        if (!root.IsMap()) {
            return std::unexpected(error{error_code::protocol_mismatch, fmt::format("{} is not an object", what)});
        }
        return root;
    } catch (const YAML::Exception& e) {
        return std::unexpected(error{error_code::protocol_mismatch,
            fmt::format("{} is not valid JSON: {}", what, e.what())});
    }
}

std::string scalar_or(const YAML::Node& node, std::string fallback = {}) {
    if (node && node.IsScalar()) {
        return node.Scalar();
    }
    return fallback;
}

} // anonymous namespace

namespace detail {

std::optional<std::string> find_download_metadata(std::string_view page) {
    constexpr std::string_view marker = "downloadMetadata";
    const auto is_space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    for (size_t pos = page.find(marker); pos != std::string_view::npos; pos = page.find(marker, pos + 1)) {
        size_t cursor = pos + marker.size();
        while (cursor < page.size() && is_space(page[cursor])) {
            ++cursor;
        }
        if (cursor >= page.size() || page[cursor] != '=') {
            continue;
        }
        ++cursor;
        while (cursor < page.size() && is_space(page[cursor])) {
            ++cursor;
        }
        if (cursor >= page.size() || page[cursor] != '{') {
            continue;
        }

        // The object ends at the last '}' before the first ';'
        const size_t stop = std::min(page.find(';', cursor), page.size());
        const auto candidate = page.substr(cursor, stop - cursor);
        const size_t close = candidate.rfind('}');
        if (close == std::string_view::npos || close < 2) {
            continue;
        }
        return std::string{candidate.substr(0, close + 1)};
    }
    return std::nullopt;
}

auto parse_metadata_json(std::string_view json) -> std::expected<send_metadata, error> {
    auto root = load_json(json, "Decrypted metadata");
    if (!root) {
        return std::unexpected(root.error());
    }

    const YAML::Node& doc = *root;
    try {
        send_metadata metadata;
        metadata.name = scalar_or(doc["name"]);
        metadata.type = scalar_or(doc["type"]);
        metadata.size = doc["size"].as<uint64_t>(0);

        if (const auto manifest = doc["manifest"]; manifest && manifest.IsMap()) {
            send_manifest parsed;
            if (const auto files = manifest["files"]; files && files.IsSequence()) {
                for (const auto& file : files) {
                    parsed.files.push_back(manifest_file{scalar_or(file["name"]), file["size"].as<uint64_t>(0)});
                }
            }
            metadata.manifest = std::move(parsed);
        }
        return metadata;
    } catch (const YAML::Exception& e) {
        return std::unexpected(error{error_code::protocol_mismatch,
            fmt::format("Unexpected metadata layout: {}", e.what())});
    }
}

std::string strip_auth_scheme(std::string_view value) {
    const std::string prefix = fmt::format("{} ", AUTH_SCHEME);
    if (value.starts_with(prefix)) {
        value.remove_prefix(prefix.size());
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return std::string{value};
}

} // namespace detail

auto fetch_nonce(http_transport &transport, const share_locator &locator) -> std::expected<nonce_info, error> {
    auto response = transport.get(http_request{locator.download_page_url(), {}});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(status_error(*response, "Download page request", false));
    }

    const auto embedded = detail::find_download_metadata(response->body);
    if (!embedded) {
        return std::unexpected(error{error_code::protocol_mismatch, "Download page has no downloadMetadata"});
    }

    auto root = load_json(*embedded, "downloadMetadata");
    if (!root) {
        return std::unexpected(root.error());
    }

    const YAML::Node& doc = *root;
    try {
        if (doc["status"].as<int>(0) == 404) {
            return std::unexpected(error{error_code::not_found, "File not found or link has expired"});
        }

        nonce_info info;
        info.nonce = scalar_or(doc["nonce"]);
        if (info.nonce.empty()) {
            return std::unexpected(error{error_code::protocol_mismatch, "downloadMetadata carries no nonce"});
        }
        info.requires_password = doc["pwd"].as<bool>(false);

        logger()->debug("Nonce for {} received, password required: {}", locator.file_id, info.requires_password);
        return info;
    } catch (const YAML::Exception& e) {
        return std::unexpected(error{error_code::protocol_mismatch,
            fmt::format("Unexpected downloadMetadata layout: {}", e.what())});
    }
}

auto derive_auth_key(const share_locator &locator, std::string_view canonical_url, std::string_view password,
                     const bool requires_password) -> std::expected<auth_key, error> {
    auto derived = requires_password && !password.empty()
        ? crypto::pbkdf2_sha256(password, canonical_url, PASSWORD_KDF_ITERATIONS, AUTH_KEY_SIZE)
        : crypto::hkdf_sha256(locator.url_secret, {}, AUTH_KEY_INFO, AUTH_KEY_SIZE);
    if (!derived) {
        return std::unexpected(derived.error());
    }

    auth_key key{};
    std::ranges::copy(*derived, key.begin());
    return key;
}

auto build_auth_header(const auth_key &key, std::string_view nonce) -> std::expected<std::string, error> {
    const auto nonce_bytes = crypto::base64_decode(nonce);
    if (!nonce_bytes) {
        return std::unexpected(error{error_code::protocol_mismatch, "Nonce is not valid base64"});
    }

    auto signature = crypto::hmac_sha256(key, *nonce_bytes);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    return fmt::format("{} {}", AUTH_SCHEME, crypto::base64_encode(*signature));
}

auto fetch_metadata(http_transport &transport, const share_locator &locator, const auth_session &session)
    -> std::expected<metadata_result, error> {
    auto authorization = build_auth_header(session.key, session.nonce);
    if (!authorization) {
        return std::unexpected(authorization.error());
    }

    auto response = transport.get(http_request{locator.metadata_url(), {{"Authorization", *authorization}}});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(status_error(*response, "Metadata request", true));
    }

    metadata_result result;
    result.next.key = session.key;
    const auto issued = response->header("WWW-Authenticate");
    result.next.nonce = issued ? detail::strip_auth_scheme(*issued) : session.nonce;
    if (result.next.nonce.empty()) {
        result.next.nonce = session.nonce;
    }

    auto envelope = load_json(response->body, "Metadata response");
    if (!envelope) {
        return std::unexpected(envelope.error());
    }

    const YAML::Node& body = *envelope;
    const auto encoded = scalar_or(body["metadata"]);
    const auto sealed = crypto::base64_decode(encoded);
    if (encoded.empty() || !sealed) {
        return std::unexpected(error{error_code::protocol_mismatch, "Metadata response carries no metadata"});
    }

    auto key = crypto::hkdf_sha256(locator.url_secret, {}, METADATA_KEY_INFO, crypto::AES128_KEY_SIZE);
    if (!key) {
        return std::unexpected(key.error());
    }

    const std::array<std::byte, crypto::GCM_IV_SIZE> zero_iv{};
    auto plaintext = crypto::aes128gcm_decrypt(*key, zero_iv, *sealed);
    if (!plaintext) {
        return std::unexpected(error{error_code::decryption_failed,
            fmt::format("Failed to decrypt metadata: {}", plaintext.error().message())});
    }

    auto metadata = detail::parse_metadata_json(
        std::string_view{reinterpret_cast<const char*>(plaintext->data()), plaintext->size()});
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    result.metadata = std::move(*metadata);
    return result;
}

auto download_and_decrypt(http_transport &transport, const share_locator &locator, const auth_session &session,
                          const size_t max_record_size) -> std::expected<std::vector<std::byte>, error> {
    auto authorization = build_auth_header(session.key, session.nonce);
    if (!authorization) {
        return std::unexpected(authorization.error());
    }

    std::vector<std::byte> data;
    ece_decryptor decryptor{locator.url_secret,
        [&data](std::span<const std::byte> plaintext) -> std::expected<void, error> {
            data.insert(data.end(), plaintext.begin(), plaintext.end());
            return {};
        },
        max_record_size};

    uint64_t received = 0;
    const body_sink sink = [&decryptor, &received](std::span<const std::byte> chunk) {
        received += chunk.size();
        return decryptor.update(chunk);
    };

    auto response = transport.get_streaming(
        http_request{locator.blob_url(), {{"Authorization", *authorization}}}, sink);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(status_error(*response, "Blob download", true));
    }

    if (auto finish_result = decryptor.finish(); !finish_result) {
        return std::unexpected(finish_result.error());
    }

    logger()->debug("Decrypted {} bytes from {} encrypted bytes in {} records",
                    data.size(), received, decryptor.records());
    return data;
}

auto download_from_send(http_transport &transport, std::string_view url, std::string_view password,
                        const client_options &options) -> std::expected<download_result, error> {
    const std::string canonical = canonicalize_share_url(url);

    auto locator = parse_share_url(canonical);
    if (!locator) {
        return std::unexpected(locator.error());
    }

    logger()->info("Downloading {} from {} (password supplied: {})",
                   locator->file_id, locator->base_url, !password.empty());

    auto nonce = fetch_nonce(transport, *locator);
    if (!nonce) {
        return std::unexpected(nonce.error());
    }
    if (nonce->requires_password && password.empty()) {
        logger()->warn("Link {} requires a password but none was given", locator->file_id);
    }

    auto key = derive_auth_key(*locator, canonical, password, nonce->requires_password);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto metadata = fetch_metadata(transport, *locator, auth_session{*key, nonce->nonce});
    if (!metadata) {
        return std::unexpected(metadata.error());
    }
    logger()->info("Metadata for {}: name '{}', {} bytes", locator->file_id,
                   metadata->metadata.name, metadata->metadata.size);

    // The blob request must be signed with the nonce issued by the metadata response
    auto data = download_and_decrypt(transport, *locator, metadata->next, options.max_record_size);
    if (!data) {
        return std::unexpected(data.error());
    }
    logger()->info("Decrypted {} bytes for {}", data->size(), locator->file_id);

    return download_result{std::move(*data), std::move(metadata->metadata)};
}

auto download_from_send(std::string_view url, std::string_view password, const client_options &options)
    -> std::expected<download_result, error> {
    curl_transport transport{options};
    return download_from_send(transport, url, password, options);
}

} // namespace bugsift::send
