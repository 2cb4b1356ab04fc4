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
#include <zlib.h>
#include <expected>
#include <memory>
#include <vector>

namespace bugsift {

enum class compression_format {
    gzip,        // RFC 1952 framing, concatenated members allowed
    raw_deflate  // RFC 1951, as stored in ZIP entries
};

// Pull-based chunked inflater. Only one input window and whatever the
// caller asks for at a time are ever held, so archives larger than any
// single allocation can be walked.
class inflate_stream : public input_stream {
private:
    struct zstream_deleter {
        void operator()(z_stream* zs) const {
            if (zs) {
                inflateEnd(zs);
                delete zs;
            }
        }
    };

    std::unique_ptr<input_stream> source_;
    std::unique_ptr<z_stream, zstream_deleter> zstream_;
    std::vector<std::byte> input_;
    compression_format format_;
    bool source_exhausted_ = false;
    bool finished_ = false;
    bool closed_ = false;
    uint64_t total_out_ = 0;

    inflate_stream(std::unique_ptr<input_stream> source, std::unique_ptr<z_stream, zstream_deleter> zs,
                   compression_format format, size_t window_size);

    [[nodiscard]] std::expected<void, error> refill();

    // After a gzip member ends, decide whether another member follows
    [[nodiscard]] std::expected<bool, error> start_next_member();

public:
    static constexpr size_t DEFAULT_WINDOW_SIZE = 64 * 1024;

    [[nodiscard]] static std::expected<std::unique_ptr<inflate_stream>, error> create(
        std::unique_ptr<input_stream> source,
        compression_format format,
        size_t window_size = DEFAULT_WINDOW_SIZE);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;

    // Stop decompressing: tears down the zlib state and drops the source.
    // Reads after close() fail with error_code::cancelled.
    void close();

    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] uint64_t total_out() const noexcept { return total_out_; }
};

} // namespace bugsift
