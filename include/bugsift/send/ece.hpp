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
#include <bugsift/send/crypto.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

// RFC 8188 "aes128gcm" content encoding
namespace bugsift::send {

constexpr size_t ECE_SALT_SIZE = 16;
constexpr size_t ECE_HEADER_FIXED_SIZE = ECE_SALT_SIZE + 4 + 1;   // salt, rs, idlen
constexpr size_t ECE_MIN_RECORD_SIZE = crypto::GCM_TAG_SIZE + 2;  // tag, delimiter, one byte
constexpr size_t ECE_DEFAULT_MAX_RECORD_SIZE = 16 * 1024 * 1024;

// RFC 8188 marks the last record with 0x02 and every other with 0x01.
// Writers disagree on which is which, so the decryptor accepts either, but
// the final record must carry a different delimiter than the one before it.
constexpr std::byte ECE_DELIMITER_RECORD{0x01};
constexpr std::byte ECE_DELIMITER_LAST{0x02};

// Both labels include their terminating NUL
constexpr std::string_view ECE_KEY_INFO{"Content-Encoding: aes128gcm", 28};
constexpr std::string_view ECE_NONCE_INFO{"Content-Encoding: nonce", 24};

// Receives each record's plaintext in order
using plaintext_sink = std::function<std::expected<void, error>(std::span<const std::byte>)>;

// Push-style decryptor: feed ciphertext in chunks of any size as it arrives
// from the network. Only the header and a single record are ever buffered.
class ece_decryptor {
private:
    crypto::byte_buffer secret_;
    plaintext_sink sink_;
    size_t max_record_size_;

    crypto::byte_buffer header_;
    size_t header_size_ = 0;     // 0 until idlen has been seen
    uint32_t record_size_ = 0;
    crypto::byte_buffer key_;
    crypto::byte_buffer base_nonce_;

    crypto::byte_buffer record_;
    crypto::byte_buffer plaintext_;
    uint64_t sequence_ = 0;
    std::optional<std::byte> previous_delimiter_;
    std::optional<std::byte> last_delimiter_;
    bool finished_ = false;
    bool failed_ = false;
    uint64_t plaintext_total_ = 0;

    [[nodiscard]] std::expected<void, error> consume_header(std::span<const std::byte>& chunk);
    [[nodiscard]] std::expected<void, error> decrypt_record();
    [[nodiscard]] std::expected<void, error> fail(error err);

public:
    ece_decryptor(std::span<const std::byte> secret, plaintext_sink sink,
                  size_t max_record_size = ECE_DEFAULT_MAX_RECORD_SIZE);

    // Feed the next slice of the encrypted stream
    [[nodiscard]] std::expected<void, error> update(std::span<const std::byte> chunk);

    // Flush the trailing short record and reject a stream that stops
    // between two non-final records
    [[nodiscard]] std::expected<void, error> finish();

    [[nodiscard]] uint32_t record_size() const noexcept { return record_size_; }
    [[nodiscard]] uint64_t records() const noexcept { return sequence_; }
    [[nodiscard]] uint64_t plaintext_size() const noexcept { return plaintext_total_; }
};

// Record nonce: base nonce with the sequence number XORed into its last
// four bytes, big-endian
[[nodiscard]] crypto::byte_buffer ece_record_nonce(std::span<const std::byte> base_nonce, uint32_t sequence);

// One-shot decrypt of a whole buffer
[[nodiscard]] std::expected<crypto::byte_buffer, error> ece_decrypt(
    std::span<const std::byte> secret,
    std::span<const std::byte> encrypted,
    size_t max_record_size = ECE_DEFAULT_MAX_RECORD_SIZE);

// Produce the same framing: full records of record_size bytes with a 0x01
// delimiter, the last one (possibly shorter) with 0x02. No padding, empty
// key id.
[[nodiscard]] std::expected<crypto::byte_buffer, error> ece_encrypt(
    std::span<const std::byte> secret,
    std::span<const std::byte> salt,
    std::span<const std::byte> plaintext,
    uint32_t record_size);

} // namespace bugsift::send
