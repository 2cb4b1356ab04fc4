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

#include <yaml-cpp/yaml.h>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bugsift::k8s::detail {

// Null-safe navigation helpers. Missing keys, nulls and wrongly typed
// nodes all read as absent instead of throwing.

[[nodiscard]] inline YAML::Node child(const YAML::Node& node, const char* key) {
    if (node.IsMap()) {
        if (auto found = node[key]; found.IsDefined()) {
            return found;
        }
    }
    return YAML::Node{YAML::NodeType::Undefined};
}

[[nodiscard]] inline YAML::Node path(const YAML::Node& node, std::initializer_list<const char*> keys) {
    // reset() rebinds; operator= would write through into the document
    YAML::Node current;
    current.reset(node);
    for (const char* key : keys) {
        current.reset(child(current, key));
    }
    return current;
}

[[nodiscard]] inline std::optional<std::string> scalar(const YAML::Node& node) {
    if (node.IsScalar()) {
        return node.Scalar();
    }
    return std::nullopt;
}

[[nodiscard]] inline std::string scalar_or_empty(const YAML::Node& node) {
    return scalar(node).value_or(std::string{});
}

// Scalar entries of a mapping; nested or null values are left out
[[nodiscard]] inline std::map<std::string, std::string> string_map(const YAML::Node& node) {
    std::map<std::string, std::string> out;
    if (!node.IsMap()) {
        return out;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (it->first.IsScalar() && it->second.IsScalar()) {
            out.emplace(it->first.Scalar(), it->second.Scalar());
        }
    }
    return out;
}

} // namespace bugsift::k8s::detail
