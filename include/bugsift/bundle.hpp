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
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bugsift {

// The three files a bug report bundle is searched for, each living in a
// directory named "cluster" somewhere in the archive
enum class bundle_member {
    cluster_context,
    nodes,
    k8s_resources
};

constexpr size_t BUNDLE_MEMBER_COUNT = 3;

// Match an archive path against cluster/{cluster-context,nodes,k8s-resources}
// using its last two segments only
[[nodiscard]] std::optional<bundle_member> match_bundle_member(std::string_view path) noexcept;

struct bundle_files {
    std::string cluster_name;     // First non-empty line of cluster-context, trimmed
    std::string cluster_context;
    std::string nodes;
    std::string k8s_resources;
    size_t found = 0;             // Distinct members seen
    bool cancelled_early = false; // Stopped before the end of the archive

    [[nodiscard]] bool complete() const noexcept { return found == BUNDLE_MEMBER_COUNT; }

    // Whether there is anything for the resource parsers to work on
    [[nodiscard]] bool has_inventory() const noexcept {
        return !nodes.empty() || !k8s_resources.empty();
    }
};

// Walk a gzip-compressed TAR and keep only the bundle members. Reading stops
// and the inflater is shut down as soon as all three are in hand, so the
// rest of the archive is never decompressed.
[[nodiscard]] std::expected<bundle_files, error> extract_bundle_files(std::unique_ptr<input_stream> gzip_source);

// Same, for a gzip-TAR already in memory. The span must stay valid for the
// duration of the call only.
[[nodiscard]] std::expected<bundle_files, error> extract_bundle_files(std::span<const std::byte> gzip_data);

[[nodiscard]] std::string first_line_trimmed(std::string_view text);

} // namespace bugsift
