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

#include <bugsift/tar/archive_reader.hpp>
#include <algorithm>
#include <charconv>
#include <vector>

namespace bugsift::tar {

namespace {

// PAX headers are tiny key=value lists; anything larger is not something
// we want to buffer
constexpr uint64_t MAX_PAX_HEADER_SIZE = 1024 * 1024;

std::string strip_dot_slash(std::string path) {
    while (path.starts_with("./")) {
        path.erase(0, 2);
    }
    return path;
}

} // anonymous namespace

auto archive_reader::from_stream(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    return archive_reader{std::move(stream)};
}

void archive_reader::close() {
    current_entry_.reset();
    current_entry_data_remaining_ = 0;
    current_entry_size_ = 0;
    stream_.reset();
    finished_ = true;
}

auto archive_reader::read_block() -> std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> {
    std::array<std::byte, detail::BLOCK_SIZE> block{};

    // Decompressing streams hand back short reads, so keep pulling
    auto result = read_fully(*stream_, block);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result != detail::BLOCK_SIZE) {
        if (*result == 0) {
            return std::unexpected(error{error_code::end_of_archive, "Unexpected end of archive"});
        }
        return std::unexpected(error{error_code::corrupt_archive, "Incomplete block read"});
    }

    return block;
}

auto archive_reader::skip_padding(const uint64_t data_size) -> std::expected<void, error> {
    const size_t padding = (detail::BLOCK_SIZE - (data_size % detail::BLOCK_SIZE)) % detail::BLOCK_SIZE;
    if (padding > 0) {
        return stream_->skip(padding);
    }
    return {};
}

auto archive_reader::skip_current_entry_data() -> std::expected<void, error> {
    if (current_entry_data_remaining_ > 0) {
        if (auto skip_result = stream_->skip(current_entry_data_remaining_); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    // Padding follows any data, even if the caller consumed all of it
    if (current_entry_size_ > 0) {
        if (auto padding_result = skip_padding(current_entry_size_); !padding_result) {
            return std::unexpected(padding_result.error());
        }
    }

    current_entry_data_remaining_ = 0;
    current_entry_size_ = 0;

    return {};
}

auto archive_reader::next_entry() -> std::expected<std::optional<archive_entry>, error> {
    while (true) {
        if (finished_ || !stream_) {
            return std::nullopt;
        }

        // Skip any remaining data from the previous entry
        if (auto skip_result = skip_current_entry_data(); !skip_result) {
            return std::unexpected(skip_result.error());
        }
        current_entry_.reset();

        auto block_result = read_block();
        if (!block_result) {
            // Plenty of writers omit the trailing zero blocks
            if (block_result.error().code() == error_code::end_of_archive) {
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(block_result.error());
        }

        if (detail::is_zero_block(*block_result)) {
            // A second zero block, or a clean end of stream, terminates the archive
            auto second_block = read_block();
            if (!second_block && second_block.error().code() != error_code::end_of_archive) {
                return std::unexpected(second_block.error());
            }
            if (!second_block || detail::is_zero_block(*second_block)) {
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(error{error_code::corrupt_archive, "Single zero block in archive"});
        }

        auto metadata_result = detail::parse_header(*block_result);
        if (!metadata_result) {
            return std::unexpected(metadata_result.error());
        }

        auto process_result = process_extension(*metadata_result);
        if (!process_result) {
            return std::unexpected(process_result.error());
        }
        if (*process_result) {
            continue;
        }

        auto final_metadata = std::move(*metadata_result);
        apply_extensions(final_metadata, pending_);
        pending_.clear();
        final_metadata.path = strip_dot_slash(std::move(final_metadata.path));

        // Only regular files carry data in the stream that callers may read.
        // Links, devices and directories may still declare a size; it is
        // skipped along with the padding.
        current_entry_size_ = final_metadata.size;
        current_entry_data_remaining_ = final_metadata.size;

        auto* stream_ptr = stream_.get();
        auto* remaining_ptr = &current_entry_data_remaining_;

        data_reader_fn reader = [stream_ptr, remaining_ptr](std::span<std::byte> buffer)
            -> std::expected<size_t, error> {
            const size_t to_read = static_cast<size_t>(
                std::min<uint64_t>(buffer.size(), *remaining_ptr));
            if (to_read == 0) {
                return size_t{0};
            }

            auto result = stream_ptr->read(buffer.first(to_read));
            if (!result) {
                return std::unexpected(result.error());
            }
            if (*result == 0) {
                return std::unexpected(error{error_code::corrupt_archive,
                    "Archive ended inside entry data"});
            }

            *remaining_ptr -= *result;
            return *result;
        };

        archive_entry entry{std::move(final_metadata), std::move(reader)};
        current_entry_ = entry;

        return entry;
    }
}

auto archive_reader::process_extension(const file_metadata &meta) -> std::expected<bool, error> {
    if (meta.is_gnu_longname()) {
        auto longname_result = gnu::read_extension_data(*stream_, meta.size);
        if (!longname_result) {
            return std::unexpected(longname_result.error());
        }

        pending_.path = std::move(*longname_result);
        return true;
    }

    if (meta.is_gnu_longlink()) {
        // Link targets are irrelevant here, but the payload must be consumed
        auto longlink_result = gnu::read_extension_data(*stream_, meta.size);
        if (!longlink_result) {
            return std::unexpected(longlink_result.error());
        }
        return true;
    }

    if (meta.type == entry_type::pax_extended_header) {
        if (meta.size > MAX_PAX_HEADER_SIZE) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header too large"});
        }

        std::vector<std::byte> pax_data(static_cast<size_t>(meta.size));
        auto read_result = read_fully(*stream_, pax_data);
        if (!read_result) {
            return std::unexpected(read_result.error());
        }

        if (*read_result != meta.size) {
            return std::unexpected(error{error_code::corrupt_archive, "Incomplete PAX header data"});
        }

        auto parse_result = pax::parse_pax_headers(pax_data);
        if (!parse_result) {
            return std::unexpected(parse_result.error());
        }

        if (auto path_it = parse_result->find("path"); path_it != parse_result->end()) {
            pending_.path = path_it->second;
        }
        if (auto size_it = parse_result->find("size"); size_it != parse_result->end()) {
            uint64_t pax_size = 0;
            const auto& value = size_it->second;
            if (std::from_chars(value.data(), value.data() + value.size(), pax_size).ec == std::errc{}) {
                pending_.size = pax_size;
            }
        }

        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }

        return true;
    }

    if (meta.type == entry_type::pax_global_header) {
        // Global headers apply to all subsequent entries; none of their
        // keywords matter for locating members by path
        if (auto skip_result = stream_->skip(meta.size); !skip_result) {
            return std::unexpected(skip_result.error());
        }

        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }

        return true;
    }

    return false;
}

} // namespace bugsift::tar
