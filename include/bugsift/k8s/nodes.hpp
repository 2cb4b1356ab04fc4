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

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bugsift::k8s {

struct parsed_node {
    std::string cluster;
    std::string name;
    std::string type;           // Instance type or instance group
    std::string region;
    std::string zone;
    double cpus = 0.0;
    double memory_gib = 0.0;
    std::string k8s_version;
    std::string os;
    std::string arch;
};

// Node inventory from either `kubectl get nodes -o yaml` or
// `kubectl describe nodes` output, picked by the first non-blank line.
// Content that cannot be parsed yields an empty list.
[[nodiscard]] std::vector<parsed_node> extract_nodes(std::string_view cluster, std::string_view content);

[[nodiscard]] std::vector<parsed_node> extract_nodes_from_yaml(std::string_view cluster, std::string_view content);

[[nodiscard]] std::vector<parsed_node> extract_nodes_from_describe(std::string_view cluster, std::string_view content);

// True when the first non-blank line starts with "Name:"
[[nodiscard]] bool is_describe_output(std::string_view content) noexcept;

// Drop every "annotations:" mapping and the lines nested below it.
// Annotation values often hold unquoted JSON that is not valid YAML.
[[nodiscard]] std::string strip_annotations(std::string_view yaml);

namespace detail {

struct node_placement {
    std::string type;
    std::string region;
    std::string zone;
};

// Instance type, zone and region from well-known labels, newest first;
// the region falls back to the zone without its trailing "-<letter>"
[[nodiscard]] node_placement resolve_placement(const std::map<std::string, std::string>& labels);

} // namespace detail

} // namespace bugsift::k8s
