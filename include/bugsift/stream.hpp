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
#include <expected>
#include <span>
#include <algorithm>
#include <ranges>
#include <cstddef>

namespace bugsift {

// Base interface for reading data streams
class input_stream {
public:
    virtual ~input_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read.
    // Zero means the stream is exhausted.
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Skip n bytes in the stream
    [[nodiscard]] virtual std::expected<void, error> skip(size_t bytes) = 0;

    // Check if at end of stream
    [[nodiscard]] virtual bool at_end() const = 0;
};

// Non-owning view over bytes already in memory
class memory_stream : public input_stream {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit memory_stream(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        size_t available = data_.size() - position_;
        size_t to_read = std::min(buffer.size(), available);

        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                           static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;

        return to_read;
    }

    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override {
        if (position_ + bytes > data_.size()) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
        position_ += bytes;
        return {};
    }

    [[nodiscard]] bool at_end() const override {
        return position_ >= data_.size();
    }

    [[nodiscard]] size_t position() const noexcept { return position_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
};

// Skip by reading into a scratch buffer, for streams that cannot seek
[[nodiscard]] std::expected<void, error> skip_by_reading(input_stream& stream, size_t bytes);

// Fill buffer completely unless the stream ends first; returns bytes read
[[nodiscard]] std::expected<size_t, error> read_fully(input_stream& stream, std::span<std::byte> buffer);

} // namespace bugsift
