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

#include <bugsift/tar/archive_entry.hpp>
#include <array>

namespace bugsift::tar {

auto archive_entry::read(std::span<std::byte> buffer) const -> std::expected<size_t, error> {
    if (!is_regular_file()) {
        return std::unexpected(error{error_code::invalid_operation, "Entry is not a regular file"});
    }
    return reader_(buffer);
}

auto archive_entry::read_all() const -> std::expected<std::string, error> {
    if (!is_regular_file()) {
        return std::unexpected(error{error_code::invalid_operation, "Entry is not a regular file"});
    }

    std::string content;
    content.reserve(static_cast<size_t>(metadata_.size));

    std::array<std::byte, 65536> buffer{};
    while (true) {
        auto result = reader_(buffer);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        content.append(reinterpret_cast<const char*>(buffer.data()), *result);
    }

    if (content.size() != metadata_.size) {
        return std::unexpected(error{error_code::corrupt_archive,
            "Entry data ended before its recorded size"});
    }

    return content;
}

} // namespace bugsift::tar
