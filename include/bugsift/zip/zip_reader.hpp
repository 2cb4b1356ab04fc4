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
#include <bugsift/stream.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bugsift::zip {

constexpr uint32_t LOCAL_FILE_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_FILE_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;

constexpr size_t LOCAL_FILE_HEADER_SIZE = 30;
constexpr size_t CENTRAL_FILE_HEADER_SIZE = 46;
constexpr size_t EOCD_SIZE = 22;
// EOCD plus the longest possible archive comment
constexpr size_t EOCD_MAX_SEARCH = EOCD_SIZE + 65535;

// Offsets of the fields we read, relative to the EOCD signature
constexpr size_t EOCD_ENTRY_COUNT_OFFSET = 10;
constexpr size_t EOCD_CD_SIZE_OFFSET = 12;
constexpr size_t EOCD_CD_OFFSET_OFFSET = 16;

enum class compression_method : uint16_t {
    stored = 0,
    deflated = 8
};

struct eocd_record {
    size_t offset = 0;          // Position of the EOCD signature
    uint16_t entry_count = 0;
    uint32_t cd_size = 0;
    uint32_t cd_offset = 0;
};

// Scan backward from the end for the EOCD signature, bounded to the
// largest EOCD + comment size
[[nodiscard]] std::optional<eocd_record> find_eocd(std::span<const std::byte> data);

// Streaming writers sometimes record a wrong central directory offset.
// When the directory really sits right before the EOCD (eocd - cd_size) and
// a central file header signature is found there, the offset field is
// patched in place. Returns true when the buffer was modified; a buffer that
// does not verify is left untouched.
bool repair_streaming_eocd(std::span<std::byte> data);

struct zip_entry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;

    [[nodiscard]] bool is_directory() const noexcept {
        return !name.empty() && name.back() == '/';
    }

    [[nodiscard]] bool needs_zip64() const noexcept {
        return compressed_size == UINT32_MAX || uncompressed_size == UINT32_MAX ||
               local_header_offset == UINT32_MAX;
    }
};

// Minimal central-directory reader over an in-memory archive: lists the
// entries and opens any stored or deflated entry as a stream. The data
// span must outlive the reader and every stream it opens.
class zip_reader {
private:
    std::span<const std::byte> data_;
    std::vector<zip_entry> entries_;

    zip_reader(std::span<const std::byte> data, std::vector<zip_entry> entries)
        : data_(data), entries_(std::move(entries)) {}

public:
    [[nodiscard]] static std::expected<zip_reader, error> open(std::span<const std::byte> data);

    [[nodiscard]] const std::vector<zip_entry>& entries() const noexcept { return entries_; }

    // Open the entry's decompressed content
    [[nodiscard]] std::expected<std::unique_ptr<input_stream>, error> open_entry(const zip_entry& entry) const;
};

namespace detail {

[[nodiscard]] inline uint16_t read_le16(std::span<const std::byte> data, size_t offset) {
    return static_cast<uint16_t>(
        static_cast<uint16_t>(data[offset]) |
        static_cast<uint16_t>(static_cast<uint16_t>(data[offset + 1]) << 8));
}

[[nodiscard]] inline uint32_t read_le32(std::span<const std::byte> data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

inline void write_le32(std::span<std::byte> data, size_t offset, uint32_t value) {
    data[offset] = static_cast<std::byte>(value & 0xFF);
    data[offset + 1] = static_cast<std::byte>((value >> 8) & 0xFF);
    data[offset + 2] = static_cast<std::byte>((value >> 16) & 0xFF);
    data[offset + 3] = static_cast<std::byte>((value >> 24) & 0xFF);
}

} // namespace detail

} // namespace bugsift::zip
