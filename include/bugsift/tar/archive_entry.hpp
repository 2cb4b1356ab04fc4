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
#include <bugsift/tar/metadata.hpp>
#include <expected>
#include <functional>
#include <span>
#include <string>

namespace bugsift::tar {

// Reads the next chunk of entry data into the buffer; returns 0 once the
// entry is exhausted. Data can only be consumed front to back.
using data_reader_fn = std::function<std::expected<size_t, error>(std::span<std::byte> buffer)>;

class archive_entry {
private:
    file_metadata metadata_;
    data_reader_fn reader_;

public:
    archive_entry(file_metadata metadata, data_reader_fn reader)
        : metadata_(std::move(metadata)), reader_(std::move(reader)) {}

    [[nodiscard]] const std::string& path() const noexcept { return metadata_.path; }
    [[nodiscard]] entry_type type() const noexcept { return metadata_.type; }
    [[nodiscard]] uint64_t size() const noexcept { return metadata_.size; }

    [[nodiscard]] bool is_regular_file() const noexcept { return metadata_.is_regular_file(); }
    [[nodiscard]] bool is_directory() const noexcept { return metadata_.is_directory(); }

    // Streaming read of the next chunk. Only valid until the reader that
    // produced this entry advances.
    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) const;

    // Materialize the whole entry as text. Callers decide which entries are
    // small enough for this.
    [[nodiscard]] std::expected<std::string, error> read_all() const;

    [[nodiscard]] const file_metadata& metadata() const noexcept { return metadata_; }
};

} // namespace bugsift::tar
