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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bugsift::k8s {

// Container name of the service mesh sidecar whose overhead is reported
// separately
constexpr std::string_view SIDECAR_CONTAINER_NAME = "istio-proxy";

// Decimal places kept for the aggregated resource figures
constexpr int AGGREGATE_PRECISION = 4;

// Per-namespace workload totals. CPU in cores, memory in GiB.
struct parsed_namespace_row {
    std::string cluster;
    std::string namespace_name;
    uint64_t services = 0;          // Distinct app labels
    uint64_t pods = 0;
    uint64_t containers = 0;
    double req_cores = 0.0;
    double req_mem_gib = 0.0;
    double limit_cores = 0.0;
    double limit_mem_gib = 0.0;
    uint64_t sidecar_proxies = 0;
    double sidecar_req_cpu = 0.0;
    double sidecar_req_mem_gib = 0.0;
    double sidecar_limit_cpu = 0.0;
    double sidecar_limit_mem_gib = 0.0;
};

// Aggregate the Pod manifests in a multi-document YAML dump. Pods may stand
// alone or sit in the items of a List. Documents that fail to parse are
// skipped. Rows come back in the order namespaces were first seen.
[[nodiscard]] std::vector<parsed_namespace_row> extract_namespace_rows(std::string_view cluster, std::string_view content);

// Split on lines consisting of exactly "---"; blank documents are dropped
[[nodiscard]] std::vector<std::string_view> split_yaml_documents(std::string_view content);

} // namespace bugsift::k8s
