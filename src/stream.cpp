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

#include <bugsift/stream.hpp>
#include <array>

namespace bugsift {

auto skip_by_reading(input_stream &stream, size_t bytes) -> std::expected<void, error> {
    std::array<std::byte, 16384> scratch{};

    while (bytes > 0) {
        const size_t chunk = std::min(bytes, scratch.size());
        auto result = stream.read(std::span{scratch.data(), chunk});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
        bytes -= *result;
    }

    return {};
}

auto read_fully(input_stream &stream, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t total = 0;

    while (total < buffer.size()) {
        auto result = stream.read(buffer.subspan(total));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        total += *result;
    }

    return total;
}

} // namespace bugsift
