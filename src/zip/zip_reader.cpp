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

#include <bugsift/zip/zip_reader.hpp>
#include <bugsift/inflate_stream.hpp>
#include <bugsift/log.hpp>
#include <fmt/format.h>

namespace bugsift::zip {

auto find_eocd(std::span<const std::byte> data) -> std::optional<eocd_record> {
    if (data.size() < EOCD_SIZE) {
        return std::nullopt;
    }

    const size_t lowest = data.size() > EOCD_MAX_SEARCH ? data.size() - EOCD_MAX_SEARCH : 0;
    for (size_t pos = data.size() - EOCD_SIZE + 1; pos-- > lowest;) {
        if (detail::read_le32(data, pos) != EOCD_SIGNATURE) {
            continue;
        }

        eocd_record record;
        record.offset = pos;
        record.entry_count = detail::read_le16(data, pos + EOCD_ENTRY_COUNT_OFFSET);
        record.cd_size = detail::read_le32(data, pos + EOCD_CD_SIZE_OFFSET);
        record.cd_offset = detail::read_le32(data, pos + EOCD_CD_OFFSET_OFFSET);
        return record;
    }

    return std::nullopt;
}

bool repair_streaming_eocd(std::span<std::byte> data) {
    const auto eocd = find_eocd(data);
    if (!eocd) {
        return false;
    }

    if (eocd->cd_size > eocd->offset) {
        return false;
    }

    const size_t expected_offset = eocd->offset - eocd->cd_size;
    if (expected_offset == eocd->cd_offset || expected_offset > UINT32_MAX) {
        return false;
    }

    if (expected_offset + 4 > data.size() ||
        detail::read_le32(data, expected_offset) != CENTRAL_FILE_HEADER_SIGNATURE) {
        return false;
    }

    detail::write_le32(data, eocd->offset + EOCD_CD_OFFSET_OFFSET, static_cast<uint32_t>(expected_offset));
    logger()->debug("Patched ZIP central directory offset {} -> {}", eocd->cd_offset, expected_offset);
    return true;
}

auto zip_reader::open(std::span<const std::byte> data) -> std::expected<zip_reader, error> {
    const auto eocd = find_eocd(data);
    if (!eocd) {
        return std::unexpected(error{error_code::corrupt_archive, "ZIP end of central directory not found"});
    }

    const size_t cd_start = eocd->cd_offset;
    const size_t cd_end = cd_start + eocd->cd_size;
    if (cd_end > eocd->offset) {
        return std::unexpected(error{error_code::corrupt_archive,
            fmt::format("ZIP central directory [{}, {}) overlaps its end record at {}", cd_start, cd_end, eocd->offset)});
    }

    std::vector<zip_entry> entries;
    size_t pos = cd_start;

    // Walk by size rather than entry_count, which saturates for ZIP64 archives
    while (pos < cd_end) {
        if (pos + CENTRAL_FILE_HEADER_SIZE > cd_end ||
            detail::read_le32(data, pos) != CENTRAL_FILE_HEADER_SIGNATURE) {
            return std::unexpected(error{error_code::corrupt_archive,
                fmt::format("Invalid central file header at offset {}", pos)});
        }

        const uint16_t name_length = detail::read_le16(data, pos + 28);
        const uint16_t extra_length = detail::read_le16(data, pos + 30);
        const uint16_t comment_length = detail::read_le16(data, pos + 32);
        const size_t record_size = CENTRAL_FILE_HEADER_SIZE + name_length + extra_length + comment_length;
        if (pos + record_size > cd_end) {
            return std::unexpected(error{error_code::corrupt_archive, "Central file header extends past directory"});
        }

        zip_entry entry;
        entry.flags = detail::read_le16(data, pos + 8);
        entry.method = detail::read_le16(data, pos + 10);
        entry.compressed_size = detail::read_le32(data, pos + 20);
        entry.uncompressed_size = detail::read_le32(data, pos + 24);
        entry.local_header_offset = detail::read_le32(data, pos + 42);
        entry.name.assign(reinterpret_cast<const char*>(data.data() + pos + CENTRAL_FILE_HEADER_SIZE), name_length);

        entries.push_back(std::move(entry));
        pos += record_size;
    }

    return zip_reader{data, std::move(entries)};
}

auto zip_reader::open_entry(const zip_entry &entry) const -> std::expected<std::unique_ptr<input_stream>, error> {
    if (entry.needs_zip64()) {
        return std::unexpected(error{error_code::unsupported_feature,
            fmt::format("ZIP64 entry '{}' is not supported", entry.name)});
    }

    const size_t header = entry.local_header_offset;
    if (header + LOCAL_FILE_HEADER_SIZE > data_.size() ||
        detail::read_le32(data_, header) != LOCAL_FILE_HEADER_SIGNATURE) {
        return std::unexpected(error{error_code::corrupt_archive,
            fmt::format("Invalid local file header for '{}'", entry.name)});
    }

    // Sizes in the local header may be zero when a data descriptor follows;
    // the central directory is authoritative, the local lengths are not
    const size_t data_start = header + LOCAL_FILE_HEADER_SIZE +
                              detail::read_le16(data_, header + 26) +
                              detail::read_le16(data_, header + 28);
    if (data_start > data_.size() || entry.compressed_size > data_.size() - data_start) {
        return std::unexpected(error{error_code::corrupt_archive,
            fmt::format("Data for '{}' extends past end of archive", entry.name)});
    }

    auto source = std::make_unique<memory_stream>(data_.subspan(data_start, entry.compressed_size));

    switch (static_cast<compression_method>(entry.method)) {
        case compression_method::stored:
            return source;
        case compression_method::deflated: {
            auto inflater = inflate_stream::create(std::move(source), compression_format::raw_deflate);
            if (!inflater) {
                return std::unexpected(inflater.error());
            }
            return std::unique_ptr<input_stream>{std::move(*inflater)};
        }
    }

    return std::unexpected(error{error_code::unsupported_feature,
        fmt::format("Compression method {} for '{}' is not supported", entry.method, entry.name)});
}

} // namespace bugsift::zip
