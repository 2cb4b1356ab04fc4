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

#include <bugsift/send/ece.hpp>
#include <bugsift/log.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace bugsift::send {

namespace {

uint32_t read_be32(std::span<const std::byte> data) noexcept {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

void append_be32(crypto::byte_buffer& out, const uint32_t value) {
    out.push_back(static_cast<std::byte>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::byte>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::byte>(value & 0xFF));
}

} // anonymous namespace

crypto::byte_buffer ece_record_nonce(std::span<const std::byte> base_nonce, const uint32_t sequence) {
    crypto::byte_buffer nonce(base_nonce.begin(), base_nonce.end());
    const size_t tail = nonce.size() - 4;
    nonce[tail] ^= static_cast<std::byte>((sequence >> 24) & 0xFF);
    nonce[tail + 1] ^= static_cast<std::byte>((sequence >> 16) & 0xFF);
    nonce[tail + 2] ^= static_cast<std::byte>((sequence >> 8) & 0xFF);
    nonce[tail + 3] ^= static_cast<std::byte>(sequence & 0xFF);
    return nonce;
}

ece_decryptor::ece_decryptor(std::span<const std::byte> secret, plaintext_sink sink, const size_t max_record_size)
    : secret_(secret.begin(), secret.end()), sink_(std::move(sink)), max_record_size_(max_record_size) {}

auto ece_decryptor::fail(error err) -> std::expected<void, error> {
    failed_ = true;
    return std::unexpected(std::move(err));
}

auto ece_decryptor::consume_header(std::span<const std::byte>& chunk) -> std::expected<void, error> {
    const size_t wanted = header_size_ == 0 ? ECE_HEADER_FIXED_SIZE : header_size_;
    const size_t take = std::min(wanted - header_.size(), chunk.size());
    header_.insert(header_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(take));
    chunk = chunk.subspan(take);

    if (header_.size() < wanted) {
        return {};
    }

    if (header_size_ == 0) {
        // Fixed part complete; the key id length tells us how much more follows
        header_size_ = ECE_HEADER_FIXED_SIZE + static_cast<size_t>(header_[ECE_HEADER_FIXED_SIZE - 1]);
        if (header_.size() < header_size_) {
            return consume_header(chunk);
        }
    }

    const auto salt = std::span{header_}.first(ECE_SALT_SIZE);
    record_size_ = read_be32(std::span{header_}.subspan(ECE_SALT_SIZE, 4));

    if (record_size_ < ECE_MIN_RECORD_SIZE) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Record size {} below minimum {}", record_size_, ECE_MIN_RECORD_SIZE)});
    }
    if (record_size_ > max_record_size_) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Record size {} exceeds limit {}", record_size_, max_record_size_)});
    }

    auto key = crypto::hkdf_sha256(secret_, salt, ECE_KEY_INFO, crypto::AES128_KEY_SIZE);
    if (!key) {
        return fail(key.error());
    }
    auto nonce = crypto::hkdf_sha256(secret_, salt, ECE_NONCE_INFO, crypto::GCM_IV_SIZE);
    if (!nonce) {
        return fail(nonce.error());
    }

    key_ = std::move(*key);
    base_nonce_ = std::move(*nonce);
    record_.reserve(record_size_);
    plaintext_.resize(record_size_);

    logger()->debug("Content encoding header: record size {}, key id length {}",
                    record_size_, header_size_ - ECE_HEADER_FIXED_SIZE);
    return {};
}

auto ece_decryptor::decrypt_record() -> std::expected<void, error> {
    if (record_.size() <= crypto::GCM_TAG_SIZE) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Record {} is only {} bytes", sequence_, record_.size())});
    }
    if (sequence_ > UINT32_MAX) {
        return fail(error{error_code::decryption_failed, "Too many records"});
    }

    const auto nonce = ece_record_nonce(base_nonce_, static_cast<uint32_t>(sequence_));
    auto decrypted = crypto::aes128gcm_decrypt_into(key_, nonce, record_, plaintext_);
    if (!decrypted) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Record {}: {}", sequence_, decrypted.error().message())});
    }

    auto plaintext = std::span{plaintext_}.first(*decrypted);

    // Padding is zeros after the delimiter
    size_t end = plaintext.size();
    while (end > 0 && plaintext[end - 1] == std::byte{0}) {
        --end;
    }

    previous_delimiter_ = last_delimiter_;
    last_delimiter_.reset();
    if (end > 0 && (plaintext[end - 1] == ECE_DELIMITER_RECORD || plaintext[end - 1] == ECE_DELIMITER_LAST)) {
        last_delimiter_ = plaintext[end - 1];
        plaintext = plaintext.first(end - 1);
    } else {
        // Some writers omit the delimiter; keep the record as decrypted
        logger()->debug("Record {} carries no delimiter", sequence_);
    }

    ++sequence_;
    record_.clear();
    plaintext_total_ += plaintext.size();

    if (!plaintext.empty()) {
        if (auto sink_result = sink_(plaintext); !sink_result) {
            return fail(sink_result.error());
        }
    }
    return {};
}

auto ece_decryptor::update(std::span<const std::byte> chunk) -> std::expected<void, error> {
    if (failed_) {
        return std::unexpected(error{error_code::invalid_operation, "Decryptor already failed"});
    }
    if (finished_) {
        return std::unexpected(error{error_code::invalid_operation, "Decryptor already finished"});
    }

    if (record_size_ == 0) {
        if (auto header_result = consume_header(chunk); !header_result) {
            return header_result;
        }
    }

    while (!chunk.empty()) {
        const size_t take = std::min<size_t>(record_size_ - record_.size(), chunk.size());
        record_.insert(record_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(take));
        chunk = chunk.subspan(take);

        if (record_.size() == record_size_) {
            if (auto record_result = decrypt_record(); !record_result) {
                return record_result;
            }
        }
    }

    return {};
}

auto ece_decryptor::finish() -> std::expected<void, error> {
    if (failed_) {
        return std::unexpected(error{error_code::invalid_operation, "Decryptor already failed"});
    }
    if (finished_) {
        return {};
    }
    if (record_size_ == 0) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Truncated content encoding header ({} bytes)", header_.size())});
    }

    if (!record_.empty()) {
        if (auto record_result = decrypt_record(); !record_result) {
            return record_result;
        }
    }

    if (last_delimiter_ && previous_delimiter_ && *last_delimiter_ == *previous_delimiter_) {
        return fail(error{error_code::decryption_failed,
            fmt::format("Stream ends after record {} without a final record", sequence_ - 1)});
    }

    finished_ = true;
    return {};
}

auto ece_decrypt(std::span<const std::byte> secret, std::span<const std::byte> encrypted,
                 const size_t max_record_size) -> std::expected<crypto::byte_buffer, error> {
    crypto::byte_buffer out;
    ece_decryptor decryptor{secret, [&out](std::span<const std::byte> plaintext) -> std::expected<void, error> {
        out.insert(out.end(), plaintext.begin(), plaintext.end());
        return {};
    }, max_record_size};

    if (auto update_result = decryptor.update(encrypted); !update_result) {
        return std::unexpected(update_result.error());
    }
    if (auto finish_result = decryptor.finish(); !finish_result) {
        return std::unexpected(finish_result.error());
    }
    return out;
}

auto ece_encrypt(std::span<const std::byte> secret, std::span<const std::byte> salt,
                 std::span<const std::byte> plaintext, const uint32_t record_size)
    -> std::expected<crypto::byte_buffer, error> {
    if (salt.size() != ECE_SALT_SIZE) {
        return std::unexpected(error{error_code::invalid_operation, "Salt must be 16 bytes"});
    }
    if (record_size < ECE_MIN_RECORD_SIZE) {
        return std::unexpected(error{error_code::invalid_operation,
            fmt::format("Record size {} below minimum {}", record_size, ECE_MIN_RECORD_SIZE)});
    }

    auto key = crypto::hkdf_sha256(secret, salt, ECE_KEY_INFO, crypto::AES128_KEY_SIZE);
    if (!key) {
        return std::unexpected(key.error());
    }
    auto base_nonce = crypto::hkdf_sha256(secret, salt, ECE_NONCE_INFO, crypto::GCM_IV_SIZE);
    if (!base_nonce) {
        return std::unexpected(base_nonce.error());
    }

    crypto::byte_buffer out(salt.begin(), salt.end());
    append_be32(out, record_size);
    out.push_back(std::byte{0});  // No key id

    const size_t chunk_size = record_size - crypto::GCM_TAG_SIZE - 1;
    crypto::byte_buffer record_plaintext;
    record_plaintext.reserve(chunk_size + 1);

    size_t offset = 0;
    uint32_t sequence = 0;
    bool last = false;
    while (!last) {
        const size_t length = std::min(chunk_size, plaintext.size() - offset);
        last = offset + length == plaintext.size();

        const auto slice = plaintext.subspan(offset, length);
        record_plaintext.assign(slice.begin(), slice.end());
        record_plaintext.push_back(last ? ECE_DELIMITER_LAST : ECE_DELIMITER_RECORD);

        auto sealed = crypto::aes128gcm_encrypt(*key, ece_record_nonce(*base_nonce, sequence), record_plaintext);
        if (!sealed) {
            return std::unexpected(sealed.error());
        }
        out.insert(out.end(), sealed->begin(), sealed->end());

        offset += length;
        ++sequence;
    }

    return out;
}

} // namespace bugsift::send
