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

/**
 * parse_bundle - Reads a local bug report (.tar.gz, or .zip of them) and
 * prints the node and namespace inventories.
 *
 * Usage: ./parse_bundle <file>
 */

#include <bugsift/report.hpp>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        fmt::print(stderr, "Usage: {} <file>\n", argv[0]);
        return 1;
    }

    spdlog::cfg::load_env_levels();

    std::ifstream file{argv[1], std::ios::binary};
    if (!file) {
        fmt::print(stderr, "Cannot open {}\n", argv[1]);
        return 1;
    }

    std::vector<char> raw{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    std::vector<std::byte> data(raw.size());
    std::transform(raw.begin(), raw.end(), data.begin(), [](const char c) { return static_cast<std::byte>(c); });

    auto reports = bugsift::parse_bug_report(data);
    if (!reports) {
        fmt::print(stderr, "Failed to parse {}: {}\n", argv[1], reports.error().message());
        return 1;
    }

    fmt::print("{} cluster report(s)\n", reports->size());
    for (const auto& report : *reports) {
        fmt::print("\n[{}]\n", report.cluster_name);
        for (const auto& node : report.nodes) {
            fmt::print("node {} type={} region={} zone={} cpus={} memory_gib={:.2f} version={} os={} arch={}\n",
                       node.name, node.type, node.region, node.zone, node.cpus, node.memory_gib,
                       node.k8s_version, node.os, node.arch);
        }
        for (const auto& row : report.namespace_rows) {
            fmt::print("namespace {} services={} pods={} containers={} req={}/{} limit={}/{} sidecars={}\n",
                       row.namespace_name, row.services, row.pods, row.containers,
                       row.req_cores, row.req_mem_gib, row.limit_cores, row.limit_mem_gib, row.sidecar_proxies);
        }
    }
    return 0;
}
