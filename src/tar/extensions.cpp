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

#include <bugsift/tar/extensions.hpp>
#include <bugsift/tar/header_parser.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <span>
#include <charconv>

namespace bugsift::tar {

void apply_extensions(file_metadata& metadata, const pending_extensions& extensions) {
    if (extensions.path) {
        metadata.path = *extensions.path;
    }
    if (extensions.size) {
        metadata.size = *extensions.size;
    }
}

} // namespace bugsift::tar

namespace bugsift::tar::gnu {

// Long names beyond this are not paths anyone writes; refuse to buffer them
constexpr size_t MAX_EXTENSION_SIZE = 1024 * 1024;

auto read_extension_data(input_stream &stream, const size_t data_size) -> std::expected<std::string, error> {
    if (data_size > MAX_EXTENSION_SIZE) {
        return std::unexpected(error{error_code::corrupt_archive,
            fmt::format("Extension record of {} bytes is too large", data_size)});
    }

    std::string result(data_size, '\0');
    auto read_result = read_fully(stream, std::as_writable_bytes(std::span{result}));
    if (!read_result) {
        return std::unexpected(read_result.error());
    }
    if (*read_result != data_size) {
        return std::unexpected(error{error_code::corrupt_archive,
            "Unexpected end of stream while reading extension data"});
    }

    // Skip padding to next block boundary
    const size_t padding = (detail::BLOCK_SIZE - (data_size % detail::BLOCK_SIZE)) % detail::BLOCK_SIZE;
    if (padding > 0) {
        if (auto skip_result = stream.skip(padding); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    while (!result.empty() && result.back() == '\0') {
        result.pop_back();
    }

    return result;
}

} // namespace bugsift::tar::gnu

namespace bugsift::tar::pax {

auto parse_pax_headers(
    const std::span<const std::byte> data) -> std::expected<std::map<std::string, std::string>, error> {
    std::map<std::string, std::string> result;

    const auto start = reinterpret_cast<const char*>(data.data());
    const char* end = start + data.size();
    const char* pos = start;

    while (pos < end && *pos != '\0') {
        const char* length_start = pos;
        while (pos < end && *pos >= '0' && *pos <= '9') {
            ++pos;
        }

        if (pos == length_start || pos >= end || *pos != ' ') {
            const std::string debug_str(length_start, std::min(pos, end));
            return std::unexpected(error{error_code::invalid_header,
                fmt::format("Invalid PAX header length field, found: '{}'", debug_str)});
        }

        size_t length = 0;
        if (std::from_chars(length_start, pos, length).ec != std::errc{} || length == 0) {
            return std::unexpected(error{error_code::invalid_header, "Invalid PAX header record length"});
        }

        ++pos; // Skip space

        if (length > static_cast<size_t>(end - length_start)) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record extends beyond data"});
        }
        const char* record_end = length_start + length;
        if (record_end <= pos) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record too short"});
        }

        const char* value_end = record_end;
        if (value_end > pos && *(value_end - 1) == '\n') {
            --value_end;
        }

        const char* equals_pos = std::find(pos, value_end, '=');
        if (equals_pos == value_end) {
            return std::unexpected(error{error_code::invalid_header, "PAX header missing '=' separator"});
        }

        result[std::string(pos, equals_pos)] = std::string(equals_pos + 1, value_end);
        pos = record_end;
    }

    return result;
}

} // namespace bugsift::tar::pax
