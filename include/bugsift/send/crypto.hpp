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
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Thin wrappers over the OpenSSL EVP primitives the share-link protocol
// needs. Every failure inside OpenSSL maps to error_code::decryption_failed.
namespace bugsift::send::crypto {

using byte_buffer = std::vector<std::byte>;

constexpr size_t SHA256_SIZE = 32;
constexpr size_t AES128_KEY_SIZE = 16;
constexpr size_t GCM_IV_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;

// RFC 5869 with SHA-256. An empty salt means a hash-length string of zeros.
[[nodiscard]] std::expected<byte_buffer, error> hkdf_sha256(
    std::span<const std::byte> input_key,
    std::span<const std::byte> salt,
    std::string_view info,
    size_t length);

[[nodiscard]] std::expected<byte_buffer, error> pbkdf2_sha256(
    std::string_view password,
    std::string_view salt,
    unsigned iterations,
    size_t length);

[[nodiscard]] std::expected<byte_buffer, error> hmac_sha256(
    std::span<const std::byte> key,
    std::span<const std::byte> data);

// AES-128-GCM without AAD. The tag is appended to the ciphertext.
[[nodiscard]] std::expected<byte_buffer, error> aes128gcm_encrypt(
    std::span<const std::byte> key,
    std::span<const std::byte> iv,
    std::span<const std::byte> plaintext);

// Input is ciphertext followed by its 16-byte tag
[[nodiscard]] std::expected<byte_buffer, error> aes128gcm_decrypt(
    std::span<const std::byte> key,
    std::span<const std::byte> iv,
    std::span<const std::byte> sealed);

// Decrypt into caller-provided storage of at least sealed.size() - 16 bytes;
// returns the plaintext length
[[nodiscard]] std::expected<size_t, error> aes128gcm_decrypt_into(
    std::span<const std::byte> key,
    std::span<const std::byte> iv,
    std::span<const std::byte> sealed,
    std::span<std::byte> plaintext);

[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);
[[nodiscard]] std::string base64url_encode(std::span<const std::byte> data);

// Standard alphabet; padding optional. nullopt on invalid characters.
[[nodiscard]] std::optional<byte_buffer> base64_decode(std::string_view text);

// URL-safe alphabet ('-', '_'); padding optional
[[nodiscard]] std::optional<byte_buffer> base64url_decode(std::string_view text);

[[nodiscard]] inline std::span<const std::byte> as_bytes(std::string_view text) noexcept {
    return std::as_bytes(std::span{text.data(), text.size()});
}

} // namespace bugsift::send::crypto
