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

#include <bugsift/k8s/namespaces.hpp>
#include <bugsift/k8s/quantity.hpp>
#include <bugsift/k8s/yaml_access.hpp>
#include <bugsift/log.hpp>
#include <set>
#include <unordered_map>

namespace bugsift::k8s {

namespace {

struct namespace_totals {
    std::set<std::string> service_names;
    parsed_namespace_row row;
};

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

bool is_pod(const YAML::Node& node) {
    return detail::scalar(detail::child(node, "kind")) == "Pod";
}

// Pods in one document: the document itself, or the Pod items of a list
void collect_pods(const YAML::Node& doc, std::vector<YAML::Node>& pods) {
    if (is_pod(doc)) {
        pods.push_back(doc);
        return;
    }

    const auto items = detail::child(doc, "items");
    const bool is_list = detail::scalar(detail::child(doc, "kind")) == "List";
    if (!is_list && (!items.IsDefined() || items.IsNull())) {
        return;
    }
    if (!items.IsSequence()) {
        return;
    }

    for (const auto& item : items) {
        if (is_pod(item)) {
            pods.push_back(item);
        }
    }
}

void add_pod(namespace_totals& totals, const YAML::Node& pod) {
    auto& row = totals.row;
    ++row.pods;

    const auto labels = detail::path(pod, {"metadata", "labels"});
    auto app = detail::scalar(detail::child(labels, "app"));
    if (!app) {
        app = detail::scalar(detail::child(labels, "app.kubernetes.io/name"));
    }
    if (app && !app->empty()) {
        totals.service_names.insert(*app);
    }

    const auto containers = detail::path(pod, {"spec", "containers"});
    if (!containers.IsSequence()) {
        return;
    }

    for (const auto& container : containers) {
        ++row.containers;

        const auto requests = detail::path(container, {"resources", "requests"});
        const auto limits = detail::path(container, {"resources", "limits"});

        const double req_cpu = parse_cpu_cores(detail::scalar_or_empty(detail::child(requests, "cpu")));
        const double req_mem = parse_memory_gib(detail::scalar_or_empty(detail::child(requests, "memory")));
        const double limit_cpu = parse_cpu_cores(detail::scalar_or_empty(detail::child(limits, "cpu")));
        const double limit_mem = parse_memory_gib(detail::scalar_or_empty(detail::child(limits, "memory")));

        row.req_cores += req_cpu;
        row.req_mem_gib += req_mem;
        row.limit_cores += limit_cpu;
        row.limit_mem_gib += limit_mem;

        if (detail::scalar(detail::child(container, "name")) == SIDECAR_CONTAINER_NAME) {
            ++row.sidecar_proxies;
            row.sidecar_req_cpu += req_cpu;
            row.sidecar_req_mem_gib += req_mem;
            row.sidecar_limit_cpu += limit_cpu;
            row.sidecar_limit_mem_gib += limit_mem;
        }
    }
}

parsed_namespace_row finish_row(namespace_totals& totals) {
    auto row = std::move(totals.row);
    row.services = totals.service_names.size();
    row.req_cores = round_to(row.req_cores, AGGREGATE_PRECISION);
    row.req_mem_gib = round_to(row.req_mem_gib, AGGREGATE_PRECISION);
    row.limit_cores = round_to(row.limit_cores, AGGREGATE_PRECISION);
    row.limit_mem_gib = round_to(row.limit_mem_gib, AGGREGATE_PRECISION);
    row.sidecar_req_cpu = round_to(row.sidecar_req_cpu, AGGREGATE_PRECISION);
    row.sidecar_req_mem_gib = round_to(row.sidecar_req_mem_gib, AGGREGATE_PRECISION);
    row.sidecar_limit_cpu = round_to(row.sidecar_limit_cpu, AGGREGATE_PRECISION);
    row.sidecar_limit_mem_gib = round_to(row.sidecar_limit_mem_gib, AGGREGATE_PRECISION);
    return row;
}

} // anonymous namespace

std::vector<std::string_view> split_yaml_documents(std::string_view content) {
    std::vector<std::string_view> documents;

    size_t doc_start = 0;
    size_t line_start = 0;
    while (line_start <= content.size()) {
        const size_t newline = content.find('\n', line_start);
        const size_t line_end = newline == std::string_view::npos ? content.size() : newline;

        if (content.substr(line_start, line_end - line_start) == "---") {
            if (auto doc = trim(content.substr(doc_start, line_start - doc_start)); !doc.empty()) {
                documents.push_back(doc);
            }
            doc_start = line_end;
        }

        if (newline == std::string_view::npos) {
            break;
        }
        line_start = newline + 1;
    }

    if (auto doc = trim(content.substr(doc_start)); !doc.empty()) {
        documents.push_back(doc);
    }
    return documents;
}

std::vector<parsed_namespace_row> extract_namespace_rows(std::string_view cluster, std::string_view content) {
    std::vector<YAML::Node> pods;
    size_t skipped = 0;

    for (const auto document : split_yaml_documents(content)) {
        try {
            const YAML::Node doc = YAML::Load(std::string{document});
            collect_pods(doc, pods);
        } catch (const YAML::Exception& e) {
            ++skipped;
            logger()->debug("Skipping unparseable resource document: {}", e.what());
        }
    }

    if (skipped > 0) {
        logger()->debug("Skipped {} resource documents, {} pods collected", skipped, pods.size());
    }

    std::vector<namespace_totals> totals;
    std::unordered_map<std::string, size_t> index;

    for (const auto& pod : pods) {
        try {
            const auto name = detail::scalar(detail::path(pod, {"metadata", "namespace"})).value_or("default");

            auto [it, inserted] = index.try_emplace(name, totals.size());
            if (inserted) {
                namespace_totals fresh;
                fresh.row.cluster = std::string{cluster};
                fresh.row.namespace_name = name;
                totals.push_back(std::move(fresh));
            }
            add_pod(totals[it->second], pod);
        } catch (const YAML::Exception& e) {
            logger()->debug("Skipping malformed pod: {}", e.what());
        }
    }

    std::vector<parsed_namespace_row> rows;
    rows.reserve(totals.size());
    for (auto& entry : totals) {
        rows.push_back(finish_row(entry));
    }
    return rows;
}

} // namespace bugsift::k8s
