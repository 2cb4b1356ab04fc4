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

#include <bugsift/k8s/nodes.hpp>
#include <bugsift/k8s/quantity.hpp>
#include <bugsift/k8s/yaml_access.hpp>
#include <bugsift/log.hpp>
#include <cctype>
#include <initializer_list>
#include <optional>

namespace bugsift::k8s {

namespace {

constexpr const char* INSTANCE_TYPE_LABELS[] = {
    "node.kubernetes.io/instance-type",
    "beta.kubernetes.io/instance-type",
    "kops.k8s.io/instancegroup",
};

constexpr const char* ZONE_LABELS[] = {
    "topology.kubernetes.io/zone",
    "failure-domain.beta.kubernetes.io/zone",
};

constexpr const char* REGION_LABELS[] = {
    "topology.kubernetes.io/region",
    "failure-domain.beta.kubernetes.io/region",
};

bool is_space(const char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

template<size_t N>
std::optional<std::string> first_label(const std::map<std::string, std::string>& labels,
                                       const char* const (&keys)[N]) {
    for (const char* key : keys) {
        if (auto it = labels.find(key); it != labels.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

// Strip a trailing "-<lowercase letter>" zone suffix
std::string region_from_zone(const std::string& zone) {
    const auto size = zone.size();
    if (size >= 2 && zone[size - 2] == '-' && zone[size - 1] >= 'a' && zone[size - 1] <= 'z') {
        return zone.substr(0, size - 2);
    }
    return zone;
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& values,
                                  std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto it = values.find(key); it != values.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        const size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool starts_block(std::string_view line) noexcept {
    return line.starts_with("Name:") && (line.size() == 5 || is_space(line[5]));
}

// key=value or key: value on an indented line
void add_pair(std::map<std::string, std::string>& out, std::string_view line, const char separator, const bool trim_parts) {
    const auto pos = line.find(separator);
    if (pos == std::string_view::npos || pos == 0) {
        return;
    }
    auto key = line.substr(0, pos);
    auto value = line.substr(pos + 1);
    if (trim_parts) {
        key = trim(key);
        value = trim(value);
    }
    out.insert_or_assign(std::string{key}, std::string{value});
}

enum class describe_section {
    none,
    labels,
    capacity,
    system_info
};

struct describe_block {
    std::string name;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> capacity;
    std::map<std::string, std::string> system_info;
};

describe_block parse_describe_block(const std::vector<std::string_view>& lines, size_t begin, size_t end) {
    describe_block block;
    auto section = describe_section::none;

    for (size_t i = begin; i < end; ++i) {
        const auto line = lines[i];
        if (line.empty()) {
            continue;
        }

        const char first = line.front();
        if ((first >= 'A' && first <= 'Z') || (first >= 'a' && first <= 'z')) {
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                continue;
            }

            const auto key = trim(line.substr(0, colon));
            const auto value = trim(line.substr(colon + 1));

            if (key == "Name") {
                block.name = std::string{value};
                section = describe_section::none;
            } else if (key == "Labels") {
                section = describe_section::labels;
                if (!value.empty()) {
                    add_pair(block.labels, value, '=', false);
                }
            } else if (key == "Capacity") {
                section = describe_section::capacity;
            } else if (key == "System Info") {
                section = describe_section::system_info;
            } else {
                section = describe_section::none;
            }
            continue;
        }

        if (!is_space(first) || section == describe_section::none) {
            continue;
        }

        const auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.starts_with("---")) {
            continue;
        }

        switch (section) {
            case describe_section::labels:
                add_pair(block.labels, trimmed, '=', false);
                break;
            case describe_section::capacity:
                add_pair(block.capacity, trimmed, ':', true);
                break;
            case describe_section::system_info:
                add_pair(block.system_info, trimmed, ':', true);
                break;
            case describe_section::none:
                break;
        }
    }

    return block;
}

parsed_node make_node(std::string_view cluster, std::string name, const std::map<std::string, std::string>& labels,
                      const std::optional<std::string>& cpu, const std::optional<std::string>& memory) {
    parsed_node node;
    node.cluster = std::string{cluster};
    node.name = std::move(name);

    auto placement = detail::resolve_placement(labels);
    node.type = std::move(placement.type);
    node.region = std::move(placement.region);
    node.zone = std::move(placement.zone);

    node.cpus = parse_cpu_cores(cpu.value_or(""));
    node.memory_gib = parse_memory_gib(memory.value_or(""));
    return node;
}

std::optional<YAML::Node> load_document(std::string_view content) {
    try {
        return YAML::Load(std::string{content});
    } catch (const YAML::Exception& e) {
        logger()->debug("Node list is not valid YAML: {}", e.what());
        return std::nullopt;
    }
}

} // anonymous namespace

namespace detail {

node_placement resolve_placement(const std::map<std::string, std::string>& labels) {
    node_placement placement;
    placement.type = first_label(labels, INSTANCE_TYPE_LABELS).value_or("");
    placement.zone = first_label(labels, ZONE_LABELS).value_or("");
    placement.region = first_label(labels, REGION_LABELS).value_or(region_from_zone(placement.zone));
    return placement;
}

} // namespace detail

bool is_describe_output(std::string_view content) noexcept {
    const auto first = content.find_first_not_of(" \t\r\n\f\v");
    return first != std::string_view::npos && content.substr(first).starts_with("Name:");
}

std::string strip_annotations(std::string_view yaml) {
    std::string result;
    result.reserve(yaml.size());

    // Indent of the annotations key being skipped; -1 when not skipping
    long skip_indent = -1;
    bool first_line = true;

    for (const auto line : split_lines(yaml)) {
        if (skip_indent >= 0) {
            const auto first = line.find_first_not_of(" \t\r\n\f\v");
            if (first == std::string_view::npos || static_cast<long>(first) > skip_indent) {
                continue;
            }
            skip_indent = -1;
        }

        // ^(\s*)annotations:\s*(#.*)?$
        const auto indent = line.find_first_not_of(" \t");
        if (indent != std::string_view::npos && line.substr(indent).starts_with("annotations:")) {
            const auto rest = trim(line.substr(indent + std::string_view{"annotations:"}.size()));
            if (rest.empty() || rest.starts_with('#')) {
                skip_indent = static_cast<long>(indent);
                continue;
            }
        }

        if (!first_line) {
            result.push_back('\n');
        }
        result.append(line);
        first_line = false;
    }

    return result;
}

std::vector<parsed_node> extract_nodes_from_describe(std::string_view cluster, std::string_view content) {
    const auto lines = split_lines(content);
    std::vector<parsed_node> nodes;

    size_t begin = 0;
    while (begin < lines.size()) {
        size_t end = begin + 1;
        while (end < lines.size() && !starts_block(lines[end])) {
            ++end;
        }

        auto block = parse_describe_block(lines, begin, end);
        begin = end;

        if (block.name.empty()) {
            continue;
        }

        auto node = make_node(cluster, std::move(block.name), block.labels,
                              lookup(block.capacity, {"cpu"}), lookup(block.capacity, {"memory"}));
        node.k8s_version = lookup(block.system_info, {"Kubelet Version"}).value_or("");
        node.os = lookup(block.system_info, {"OS Image", "Operating System"}).value_or("");
        node.arch = lookup(block.system_info, {"Architecture"}).value_or("");
        nodes.push_back(std::move(node));
    }

    return nodes;
}

std::vector<parsed_node> extract_nodes_from_yaml(std::string_view cluster, std::string_view content) {
    auto doc = load_document(content);
    if (!doc) {
        // Usually annotations holding raw JSON; they are not needed here
        doc = load_document(strip_annotations(content));
        if (!doc) {
            return {};
        }
    }

    std::vector<parsed_node> nodes;
    try {
        const auto items = detail::child(*doc, "items");
        if (!items.IsSequence()) {
            return {};
        }

        for (const auto& item : items) {
            const auto labels = detail::string_map(detail::path(item, {"metadata", "labels"}));
            const auto capacity = detail::path(item, {"status", "capacity"});
            const auto info = detail::string_map(detail::path(item, {"status", "nodeInfo"}));

            auto node = make_node(cluster, detail::scalar_or_empty(detail::path(item, {"metadata", "name"})), labels,
                                  detail::scalar(detail::child(capacity, "cpu")),
                                  detail::scalar(detail::child(capacity, "memory")));
            node.k8s_version = lookup(info, {"kubeletVersion"}).value_or("");
            node.os = lookup(info, {"osImage", "operatingSystem"}).value_or("");
            node.arch = lookup(info, {"architecture"}).value_or("");
            nodes.push_back(std::move(node));
        }
    } catch (const YAML::Exception& e) {
        logger()->debug("Unexpected node list layout: {}", e.what());
        return {};
    }

    return nodes;
}

std::vector<parsed_node> extract_nodes(std::string_view cluster, std::string_view content) {
    if (is_describe_output(content)) {
        return extract_nodes_from_describe(cluster, content);
    }
    return extract_nodes_from_yaml(cluster, content);
}

} // namespace bugsift::k8s
