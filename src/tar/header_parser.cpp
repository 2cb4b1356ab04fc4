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

#include <bugsift/tar/header_parser.hpp>
#include <algorithm>
#include <bit>
#include <ranges>

namespace bugsift::tar::detail {

namespace {

constexpr size_t CHECKSUM_OFFSET = 148;
constexpr size_t CHECKSUM_LENGTH = 8;

// Some historic writers summed the header as signed chars
int32_t calculate_signed_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    int32_t sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= CHECKSUM_OFFSET && i < CHECKSUM_OFFSET + CHECKSUM_LENGTH) {
            sum += ' ';
        } else {
            sum += static_cast<signed char>(block[i]);
        }
    }
    return sum;
}

bool has_ustar_magic(const ustar_header& header) {
    // POSIX writes "ustar\0", GNU tar writes "ustar " followed by " \0"
    const std::string_view magic{header.magic, 5};
    return magic == "ustar";
}

} // anonymous namespace

uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    uint32_t sum = 0;

    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= CHECKSUM_OFFSET && i < CHECKSUM_OFFSET + CHECKSUM_LENGTH) {
            sum += static_cast<uint8_t>(' ');
        } else {
            sum += static_cast<uint8_t>(block[i]);
        }
    }

    return sum;
}

std::string_view extract_string(std::span<const char> field) {
    const auto null_pos = std::ranges::find(field, '\0');
    const size_t length = null_pos != field.end() ?
        static_cast<size_t>(std::distance(field.begin(), null_pos)) :
        field.size();
    return std::string_view{field.data(), length};
}

bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

auto parse_size_field(std::span<const char, 12> field) -> std::expected<uint64_t, error> {
    const auto first = static_cast<uint8_t>(field[0]);
    if ((first & 0x80) == 0) {
        return parse_octal(field);
    }

    // Base-256: big-endian two's complement, negative sizes are invalid
    if ((first & 0x40) != 0) {
        return std::unexpected(error{error_code::invalid_header, "Negative size field"});
    }

    uint64_t result = first & 0x3F;
    for (size_t i = 1; i < field.size(); ++i) {
        if (result > (UINT64_MAX >> 8)) {
            return std::unexpected(error{error_code::invalid_header, "Size field overflow"});
        }
        result = (result << 8) | static_cast<uint8_t>(field[i]);
    }
    return result;
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block) -> std::expected<file_metadata, error> {
    const auto* header = std::bit_cast<const ustar_header*>(block.data());

    // Parse and verify checksum
    auto stored_checksum = parse_octal(std::span{header->checksum});
    if (!stored_checksum) {
        return std::unexpected(stored_checksum.error());
    }

    if (calculate_checksum(block) != *stored_checksum &&
        static_cast<uint64_t>(calculate_signed_checksum(block)) != *stored_checksum) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    auto size = parse_size_field(std::span{header->size});
    if (!size) {
        return std::unexpected(size.error());
    }

    file_metadata meta;

    // Build path from prefix + name; the prefix only exists in ustar headers
    std::string_view name = extract_string(std::span{header->name});
    std::string_view prefix = has_ustar_magic(*header) ?
        extract_string(std::span{header->prefix}) : std::string_view{};

    if (!prefix.empty()) {
        meta.path.reserve(prefix.size() + 1 + name.size());
        meta.path.append(prefix).append("/").append(name);
    } else {
        meta.path = std::string{name};
    }

    if (meta.path.empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty file path"});
    }

    meta.type = static_cast<entry_type>(header->typeflag);
    meta.size = *size;

    return meta;
}

} // namespace bugsift::tar::detail
