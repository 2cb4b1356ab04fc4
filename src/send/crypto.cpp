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

#include <bugsift/send/crypto.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <fmt/format.h>
#include <algorithm>
#include <climits>
#include <memory>

namespace bugsift::send::crypto {

namespace {

struct pkey_ctx_deleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct cipher_ctx_deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;
using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

const unsigned char* ucp(std::span<const std::byte> data) noexcept {
    return reinterpret_cast<const unsigned char*>(data.data());
}

unsigned char* ucp(std::span<std::byte> data) noexcept {
    return reinterpret_cast<unsigned char*>(data.data());
}

// Drains the OpenSSL error queue into a message
std::unexpected<error> openssl_failure(std::string_view operation) {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return std::unexpected(error{error_code::decryption_failed, fmt::format("{} failed", operation)});
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::unexpected(error{error_code::decryption_failed, fmt::format("{} failed: {}", operation, buffer)});
}

bool fits_int(const size_t size) noexcept {
    return size <= static_cast<size_t>(INT_MAX);
}

std::optional<byte_buffer> decode_standard(std::string text) {
    while (!text.empty() && text.back() == '=') {
        text.pop_back();
    }
    for (const char c : text) {
        const bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                           (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!valid) {
            return std::nullopt;
        }
    }
    if (text.size() % 4 == 1) {
        return std::nullopt;
    }

    const size_t padding = (4 - text.size() % 4) % 4;
    text.append(padding, '=');
    if (!fits_int(text.size())) {
        return std::nullopt;
    }

    byte_buffer out(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(ucp(std::span{out}),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the padding as zero bytes
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // anonymous namespace

auto hkdf_sha256(std::span<const std::byte> input_key, std::span<const std::byte> salt,
                 std::string_view info, const size_t length) -> std::expected<byte_buffer, error> {
    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr)};
    if (!ctx) {
        return openssl_failure("HKDF context");
    }
    if (!fits_int(input_key.size()) || !fits_int(salt.size()) || !fits_int(info.size())) {
        return std::unexpected(error{error_code::invalid_operation, "HKDF input too large"});
    }

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), const_cast<unsigned char*>(ucp(input_key)),
                                   static_cast<int>(input_key.size())) <= 0) {
        return openssl_failure("HKDF setup");
    }
    if (!salt.empty() &&
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), const_cast<unsigned char*>(ucp(salt)),
                                    static_cast<int>(salt.size())) <= 0) {
        return openssl_failure("HKDF salt");
    }
    if (!info.empty() &&
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), const_cast<unsigned char*>(ucp(as_bytes(info))),
                                    static_cast<int>(info.size())) <= 0) {
        return openssl_failure("HKDF info");
    }

    byte_buffer out(length);
    size_t out_length = out.size();
    if (EVP_PKEY_derive(ctx.get(), ucp(std::span{out}), &out_length) <= 0 || out_length != length) {
        return openssl_failure("HKDF derive");
    }
    return out;
}

auto pbkdf2_sha256(std::string_view password, std::string_view salt, const unsigned iterations,
                   const size_t length) -> std::expected<byte_buffer, error> {
    if (!fits_int(password.size()) || !fits_int(salt.size()) || !fits_int(length) ||
        iterations == 0 || iterations > static_cast<unsigned>(INT_MAX)) {
        return std::unexpected(error{error_code::invalid_operation, "Invalid PBKDF2 parameters"});
    }

    byte_buffer out(length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          ucp(as_bytes(salt)), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(length), ucp(std::span{out})) != 1) {
        return openssl_failure("PBKDF2");
    }
    return out;
}

auto hmac_sha256(std::span<const std::byte> key, std::span<const std::byte> data)
    -> std::expected<byte_buffer, error> {
    if (!fits_int(key.size())) {
        return std::unexpected(error{error_code::invalid_operation, "HMAC key too large"});
    }

    byte_buffer out(SHA256_SIZE);
    unsigned int out_length = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             ucp(data), data.size(), ucp(std::span{out}), &out_length) == nullptr ||
        out_length != SHA256_SIZE) {
        return openssl_failure("HMAC");
    }
    return out;
}

auto aes128gcm_encrypt(std::span<const std::byte> key, std::span<const std::byte> iv,
                       std::span<const std::byte> plaintext) -> std::expected<byte_buffer, error> {
    if (key.size() != AES128_KEY_SIZE || iv.size() != GCM_IV_SIZE || !fits_int(plaintext.size())) {
        return std::unexpected(error{error_code::invalid_operation, "Invalid AES-128-GCM parameters"});
    }

    cipher_ctx_ptr ctx{EVP_CIPHER_CTX_new()};
    if (!ctx) {
        return openssl_failure("Cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, ucp(key), ucp(iv)) != 1) {
        return openssl_failure("AES-GCM init");
    }

    byte_buffer out(plaintext.size() + GCM_TAG_SIZE);
    int written = 0;
    if (EVP_EncryptUpdate(ctx.get(), ucp(std::span{out}), &written,
                          ucp(plaintext), static_cast<int>(plaintext.size())) != 1) {
        return openssl_failure("AES-GCM encrypt");
    }

    int final_written = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ucp(std::span{out}) + written, &final_written) != 1) {
        return openssl_failure("AES-GCM finalize");
    }

    const size_t body = static_cast<size_t>(written + final_written);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            ucp(std::span{out}) + body) != 1) {
        return openssl_failure("AES-GCM tag");
    }

    out.resize(body + GCM_TAG_SIZE);
    return out;
}

auto aes128gcm_decrypt_into(std::span<const std::byte> key, std::span<const std::byte> iv,
                            std::span<const std::byte> sealed, std::span<std::byte> plaintext)
    -> std::expected<size_t, error> {
    if (key.size() != AES128_KEY_SIZE || iv.size() != GCM_IV_SIZE) {
        return std::unexpected(error{error_code::invalid_operation, "Invalid AES-128-GCM parameters"});
    }
    if (sealed.size() < GCM_TAG_SIZE) {
        return std::unexpected(error{error_code::decryption_failed, "Ciphertext shorter than GCM tag"});
    }

    const auto ciphertext = sealed.first(sealed.size() - GCM_TAG_SIZE);
    const auto tag = sealed.last(GCM_TAG_SIZE);
    if (plaintext.size() < ciphertext.size() || !fits_int(ciphertext.size())) {
        return std::unexpected(error{error_code::invalid_operation, "Plaintext buffer too small"});
    }

    cipher_ctx_ptr ctx{EVP_CIPHER_CTX_new()};
    if (!ctx) {
        return openssl_failure("Cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, ucp(key), ucp(iv)) != 1) {
        return openssl_failure("AES-GCM init");
    }

    int written = 0;
    if (EVP_DecryptUpdate(ctx.get(), ucp(plaintext), &written,
                          ucp(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        return openssl_failure("AES-GCM decrypt");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            const_cast<unsigned char*>(ucp(tag))) != 1) {
        return openssl_failure("AES-GCM tag");
    }

    int final_written = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), ucp(plaintext) + written, &final_written) != 1) {
        ERR_clear_error();
        return std::unexpected(error{error_code::decryption_failed, "Authentication tag mismatch"});
    }

    return static_cast<size_t>(written + final_written);
}

auto aes128gcm_decrypt(std::span<const std::byte> key, std::span<const std::byte> iv,
                       std::span<const std::byte> sealed) -> std::expected<byte_buffer, error> {
    if (sealed.size() < GCM_TAG_SIZE) {
        return std::unexpected(error{error_code::decryption_failed, "Ciphertext shorter than GCM tag"});
    }

    byte_buffer out(sealed.size() - GCM_TAG_SIZE);
    auto result = aes128gcm_decrypt_into(key, iv, sealed, out);
    if (!result) {
        return std::unexpected(result.error());
    }
    out.resize(*result);
    return out;
}

std::string base64_encode(std::span<const std::byte> data) {
    if (data.empty()) {
        return {};
    }

    // Encode in bounded slices so the int length never overflows
    constexpr size_t SLICE = 3 * 1024 * 1024;
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    std::string chunk;
    for (size_t offset = 0; offset < data.size(); offset += SLICE) {
        const auto slice = data.subspan(offset, std::min(SLICE, data.size() - offset));
        chunk.resize((slice.size() + 2) / 3 * 4 + 1);
        const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(chunk.data()),
                                            ucp(slice), static_cast<int>(slice.size()));
        out.append(chunk.data(), static_cast<size_t>(written));
    }
    return out;
}

std::string base64url_encode(std::span<const std::byte> data) {
    std::string out = base64_encode(data);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

std::optional<byte_buffer> base64_decode(std::string_view text) {
    return decode_standard(std::string{text});
}

std::optional<byte_buffer> base64url_decode(std::string_view text) {
    std::string normalized{text};
    for (char& c : normalized) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (c == '+' || c == '/') {
            return std::nullopt;
        }
    }
    return decode_standard(std::move(normalized));
}

} // namespace bugsift::send::crypto
