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

#include <bugsift/inflate_stream.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <memory>

namespace bugsift {

namespace {

// 15 bits of window; +16 selects gzip framing, negative selects raw deflate
int window_bits_for(const compression_format format) {
    return format == compression_format::gzip ? 15 + 16 : -15;
}

std::string zlib_message(const z_stream& zs, const int rc) {
    return zs.msg ? std::string{zs.msg} : fmt::format("zlib error {}", rc);
}

} // anonymous namespace

inflate_stream::inflate_stream(std::unique_ptr<input_stream> source,
                               std::unique_ptr<z_stream, zstream_deleter> zs,
                               const compression_format format, const size_t window_size)
    : source_(std::move(source)), zstream_(std::move(zs)), input_(window_size), format_(format) {}

auto inflate_stream::create(std::unique_ptr<input_stream> source, const compression_format format,
                            const size_t window_size) -> std::expected<std::unique_ptr<inflate_stream>, error> {
    if (!source) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }
    if (window_size == 0 || window_size > std::numeric_limits<uInt>::max()) {
        return std::unexpected(error{error_code::invalid_operation, "Invalid inflate window size"});
    }

    auto state = std::make_unique<z_stream>();
    if (const int rc = inflateInit2(state.get(), window_bits_for(format)); rc != Z_OK) {
        return std::unexpected(error{error_code::io_error,
            fmt::format("Failed to initialize inflater: zlib error {}", rc)});
    }
    std::unique_ptr<z_stream, zstream_deleter> zs{state.release()};

    return std::unique_ptr<inflate_stream>{
        new inflate_stream{std::move(source), std::move(zs), format, window_size}};
}

auto inflate_stream::refill() -> std::expected<void, error> {
    auto result = source_->read(input_);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (*result == 0) {
        source_exhausted_ = true;
    }
    zstream_->next_in = reinterpret_cast<Bytef*>(input_.data());
    zstream_->avail_in = static_cast<uInt>(*result);
    return {};
}

auto inflate_stream::start_next_member() -> std::expected<bool, error> {
    if (format_ != compression_format::gzip) {
        return false;
    }

    if (zstream_->avail_in == 0 && !source_exhausted_) {
        if (auto refill_result = refill(); !refill_result) {
            return std::unexpected(refill_result.error());
        }
    }
    if (zstream_->avail_in == 0) {
        return false;
    }

    // Anything but another gzip header is trailing garbage, which gzip(1)
    // ignores as well
    if (zstream_->next_in[0] != 0x1f) {
        return false;
    }

    if (const int rc = inflateReset(zstream_.get()); rc != Z_OK) {
        return std::unexpected(error{error_code::corrupt_archive, zlib_message(*zstream_, rc)});
    }
    return true;
}

auto inflate_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    if (closed_) {
        return std::unexpected(error{error_code::cancelled, "Read from closed inflate stream"});
    }
    if (finished_ || buffer.empty()) {
        return size_t{0};
    }

    const size_t request = std::min<size_t>(buffer.size(), std::numeric_limits<uInt>::max());
    zstream_->next_out = reinterpret_cast<Bytef*>(buffer.data());
    zstream_->avail_out = static_cast<uInt>(request);

    while (zstream_->avail_out > 0) {
        if (zstream_->avail_in == 0 && !source_exhausted_) {
            if (auto refill_result = refill(); !refill_result) {
                return std::unexpected(refill_result.error());
            }
        }

        const int rc = inflate(zstream_.get(), Z_NO_FLUSH);

        if (rc == Z_STREAM_END) {
            auto next = start_next_member();
            if (!next) {
                return std::unexpected(next.error());
            }
            if (!*next) {
                finished_ = true;
                break;
            }
            continue;
        }

        if (rc == Z_BUF_ERROR) {
            // No progress possible: either more input is needed or there is none left
            if (source_exhausted_ && zstream_->avail_in == 0) {
                if (zstream_->avail_out < request) {
                    break;  // Report what we have; the next read fails
                }
                return std::unexpected(error{error_code::corrupt_archive, "Compressed stream is truncated"});
            }
            continue;
        }

        if (rc != Z_OK) {
            return std::unexpected(error{error_code::corrupt_archive, zlib_message(*zstream_, rc)});
        }

        // Hand back whatever is ready instead of waiting on more input
        if (zstream_->avail_out < request && zstream_->avail_in == 0) {
            break;
        }
    }

    const size_t produced = request - zstream_->avail_out;
    total_out_ += produced;
    return produced;
}

auto inflate_stream::skip(const size_t bytes) -> std::expected<void, error> {
    return skip_by_reading(*this, bytes);
}

bool inflate_stream::at_end() const {
    return finished_ || closed_;
}

void inflate_stream::close() {
    zstream_.reset();
    source_.reset();
    closed_ = true;
}

} // namespace bugsift
