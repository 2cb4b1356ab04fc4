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
#include <bugsift/k8s/namespaces.hpp>
#include <bugsift/k8s/nodes.hpp>
#include <bugsift/send/client.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace bugsift {

struct bundle_files;

struct parsed_bug_report {
    std::string cluster_name;
    std::vector<k8s::parsed_node> nodes;
    std::vector<k8s::parsed_namespace_row> namespace_rows;
};

// One report per cluster bundle in a gzip-TAR, or in each gzip-TAR inside a
// ZIP. A streaming-written ZIP has its central directory offset repaired in
// place first, hence the mutable buffer. Bundles with neither a node list
// nor a resource dump produce no report.
[[nodiscard]] std::expected<std::vector<parsed_bug_report>, error> parse_bug_report(std::span<std::byte> buffer);

// Turn extracted bundle texts into a report
[[nodiscard]] parsed_bug_report build_report(const bundle_files& files);

// A multi-file upload arrives as the concatenation of its files. Slice it
// by the manifest sizes; slices running past the end are dropped. Anything
// but a manifest of two or more files is a single file.
[[nodiscard]] std::vector<std::span<std::byte>> split_by_manifest(
    std::span<std::byte> data,
    const send::send_metadata& metadata);

struct file_failure {
    size_t index = 0;       // Position among the split files
    std::string name;       // From the manifest, when there is one
    error reason;
};

struct link_analysis {
    std::vector<parsed_bug_report> reports;
    std::vector<file_failure> failures;
    send::send_metadata metadata;
    size_t file_count = 0;
};

// Download, split and parse. Download failures are returned; a file that
// fails to parse is recorded in failures and the rest still get parsed.
[[nodiscard]] std::expected<link_analysis, error> analyze_share_link(
    send::http_transport& transport,
    std::string_view url,
    std::string_view password,
    const send::client_options& options = {});

[[nodiscard]] std::expected<link_analysis, error> analyze_share_link(
    std::string_view url,
    std::string_view password,
    const send::client_options& options = {});

} // namespace bugsift
