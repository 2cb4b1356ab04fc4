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
#include <bugsift/tar/metadata.hpp>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>

namespace bugsift::tar {

// Long path information carried by the entries that precede a real member:
// GNU 'L' records and PAX 'x' records. Both only rename (or resize) the
// next entry.
struct pending_extensions {
    std::optional<std::string> path;
    std::optional<uint64_t> size;

    [[nodiscard]] bool empty() const noexcept { return !path && !size; }

    void clear() {
        path.reset();
        size.reset();
    }
};

// Apply pending overrides to the metadata of the entry they precede
void apply_extensions(file_metadata& metadata, const pending_extensions& extensions);

} // namespace bugsift::tar

namespace bugsift::tar::gnu {

// Read an extension payload (GNU long name/link) including block padding.
// Trailing NULs are removed.
[[nodiscard]] std::expected<std::string, error> read_extension_data(input_stream& stream, size_t data_size);

} // namespace bugsift::tar::gnu

namespace bugsift::tar::pax {

// Parse PAX extended header records: "length key=value\n"
// Example: "25 path=long/file/name.txt\n"
[[nodiscard]] std::expected<std::map<std::string, std::string>, error>
parse_pax_headers(std::span<const std::byte> data);

} // namespace bugsift::tar::pax
