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
 * fetch_report - Downloads a shared bug report and prints a summary per cluster.
 *
 * Usage: ./fetch_report <share_url> [password]
 *
 * Environment:
 * - BUGSIFT_CA_BUNDLE: CA certificate file to verify the server with
 * - SPDLOG_LEVEL: log level, e.g. "debug" or "bugsift=debug"
 */

#include <bugsift/report.hpp>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <cstdlib>
#include <string_view>

namespace {

void print_report(const bugsift::parsed_bug_report& report) {
    fmt::print("Cluster: {}\n", report.cluster_name.empty() ? "(unnamed)" : report.cluster_name);

    double total_cpus = 0.0;
    double total_memory = 0.0;
    fmt::print("  Nodes: {}\n", report.nodes.size());
    for (const auto& node : report.nodes) {
        fmt::print("    {:<40} {:<14} {:<14} {:>6.1f} cpu {:>8.1f} GiB  {}\n",
                   node.name, node.type, node.zone, node.cpus, node.memory_gib, node.k8s_version);
        total_cpus += node.cpus;
        total_memory += node.memory_gib;
    }
    if (!report.nodes.empty()) {
        fmt::print("    total {:.1f} cpu, {:.1f} GiB\n", total_cpus, total_memory);
    }

    fmt::print("  Namespaces: {}\n", report.namespace_rows.size());
    for (const auto& row : report.namespace_rows) {
        fmt::print("    {:<32} {:>4} svc {:>5} pods {:>5} ctr  req {:.2f} cpu / {:.2f} GiB",
                   row.namespace_name, row.services, row.pods, row.containers, row.req_cores, row.req_mem_gib);
        if (row.sidecar_proxies > 0) {
            fmt::print("  ({} sidecars, {:.2f} cpu)", row.sidecar_proxies, row.sidecar_req_cpu);
        }
        fmt::print("\n");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        fmt::print(stderr, "Usage: {} <share_url> [password]\n", argv[0]);
        return 1;
    }

    spdlog::cfg::load_env_levels();

    bugsift::send::client_options options;
    if (const char* ca_bundle = std::getenv("BUGSIFT_CA_BUNDLE")) {
        options.ca_bundle = ca_bundle;
    }

    const std::string_view password = argc == 3 ? argv[2] : "";
    auto analysis = bugsift::analyze_share_link(argv[1], password, options);
    if (!analysis) {
        fmt::print(stderr, "Failed to fetch report: {} ({})\n",
                   analysis.error().message(), bugsift::to_string(analysis.error().code()));
        return 1;
    }

    fmt::print("File: {} ({} bytes, {} part{})\n\n", analysis->metadata.name, analysis->metadata.size,
               analysis->file_count, analysis->file_count == 1 ? "" : "s");

    for (const auto& report : analysis->reports) {
        print_report(report);
        fmt::print("\n");
    }

    for (const auto& failure : analysis->failures) {
        fmt::print(stderr, "Part {} ({}) could not be parsed: {}\n",
                   failure.index, failure.name, failure.reason.message());
    }

    if (analysis->reports.empty()) {
        fmt::print(stderr, "No cluster inventory found\n");
        return 2;
    }
    return 0;
}
