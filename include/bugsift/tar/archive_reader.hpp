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
#include <bugsift/tar/archive_entry.hpp>
#include <bugsift/tar/extensions.hpp>
#include <bugsift/tar/header_parser.hpp>
#include <array>
#include <expected>
#include <memory>
#include <optional>

namespace bugsift::tar {

// Forward-only ustar reader. Entries are handed out one at a time; reading
// the next header discards whatever the caller left unread of the previous
// entry, so nothing but the current block is ever buffered.
class archive_reader {
private:
    std::unique_ptr<input_stream> stream_;
    std::optional<archive_entry> current_entry_;
    uint64_t current_entry_size_ = 0;
    uint64_t current_entry_data_remaining_ = 0;
    bool finished_ = false;
    pending_extensions pending_;

    // Read exactly one 512-byte block
    [[nodiscard]] std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> read_block();

    // Skip padding to the next 512-byte boundary
    [[nodiscard]] std::expected<void, error> skip_padding(uint64_t data_size);

    // Skip remaining data from the current entry
    [[nodiscard]] std::expected<void, error> skip_current_entry_data();

    // Process GNU long name / PAX entries; true when the entry was consumed
    [[nodiscard]] std::expected<bool, error> process_extension(const file_metadata& meta);

public:
    explicit archive_reader(std::unique_ptr<input_stream> stream)
        : stream_(std::move(stream)) {}

    archive_reader(archive_reader&&) = default;
    archive_reader& operator=(archive_reader&&) = default;
    archive_reader(const archive_reader&) = delete;
    archive_reader& operator=(const archive_reader&) = delete;

    [[nodiscard]] static std::expected<archive_reader, error> from_stream(std::unique_ptr<input_stream> stream);

    // Get next entry in archive
    [[nodiscard]] std::expected<std::optional<archive_entry>, error> next_entry();

    // Check if archive processing is complete
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    // Release the underlying stream early. Subsequent next_entry() calls
    // report the archive as finished.
    void close();
};

} // namespace bugsift::tar
