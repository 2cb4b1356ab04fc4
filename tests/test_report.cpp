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

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <bugsift/bundle.hpp>
#include <bugsift/report.hpp>
#include "fixtures.hpp"

using namespace bugsift;
using namespace bugsift::testing;
using Catch::Approx;

namespace {

constexpr std::string_view NODES = R"(apiVersion: v1
kind: List
items:
- metadata:
    name: ip-10-0-1-10
    labels:
      node.kubernetes.io/instance-type: m5.xlarge
      topology.kubernetes.io/region: us-east-1
      topology.kubernetes.io/zone: us-east-1a
  status:
    capacity:
      cpu: "4"
      memory: 16Gi
)";

constexpr std::string_view RESOURCES = R"(apiVersion: v1
kind: Pod
metadata:
  name: ledger-0
  namespace: payments
  labels:
    app: ledger
spec:
  containers:
  - name: ledger
    resources:
      requests:
        cpu: 250m
        memory: 512Mi
)";

bytes bundle_tgz(std::string_view cluster, std::string_view nodes = NODES,
                 std::string_view resources = RESOURCES) {
    tar_builder tar;
    tar.file("bundle/cluster/cluster-context", fmt::format("{}\n", cluster));
    if (!nodes.empty()) {
        tar.file("bundle/cluster/nodes", nodes);
    }
    if (!resources.empty()) {
        tar.file("bundle/cluster/k8s-resources", resources);
    }
    tar.file("bundle/logs/app.log", noise(64 * 1024));
    return gzip(tar.build());
}

} // anonymous namespace

TEST_CASE("Report from a single bundle", "[report]") {
    auto data = bundle_tgz("prod-east");

    auto reports = parse_bug_report(data);
    REQUIRE(reports.has_value());
    REQUIRE(reports->size() == 1);

    const auto& report = reports->front();
    CHECK(report.cluster_name == "prod-east");

    REQUIRE(report.nodes.size() == 1);
    CHECK(report.nodes[0].cluster == "prod-east");
    CHECK(report.nodes[0].cpus == Approx(4.0));
    CHECK(report.nodes[0].memory_gib == Approx(16.0));
    CHECK(report.nodes[0].region == "us-east-1");

    REQUIRE(report.namespace_rows.size() == 1);
    const auto& row = report.namespace_rows[0];
    CHECK(row.cluster == "prod-east");
    CHECK(row.namespace_name == "payments");
    CHECK(row.pods == 1);
    CHECK(row.containers == 1);
    CHECK(row.services == 1);
    CHECK(row.req_cores == Approx(0.25));
    CHECK(row.req_mem_gib == Approx(0.5));
}

TEST_CASE("Bundle without inventory gives no report", "[report]") {
    auto data = bundle_tgz("empty", "", "");
    auto reports = parse_bug_report(data);
    REQUIRE(reports.has_value());
    CHECK(reports->empty());
}

TEST_CASE("Nodes-only bundle", "[report]") {
    auto data = bundle_tgz("edge", NODES, "");
    auto reports = parse_bug_report(data);
    REQUIRE(reports.has_value());
    REQUIRE(reports->size() == 1);
    CHECK(reports->front().nodes.size() == 1);
    CHECK(reports->front().namespace_rows.empty());
}

TEST_CASE("Reports from bundles inside a ZIP", "[report]") {
    SECTION("Named and sniffed bundles") {
        auto data = zip_builder{}
            .directory("upload/")
            .stored("upload/prod-east.tar.gz", bundle_tgz("prod-east"))
            .deflated("upload/notes.txt", to_bytes("see attached bundles\n"))
            .stored("upload/staging.tgz", bundle_tgz("staging"))
            .deflated("upload/attachment.bin", bundle_tgz("dev"))
            .stored("upload/empty.tar.gz", bundle_tgz("nothing", "", ""))
            .build();

        auto reports = parse_bug_report(data);
        REQUIRE(reports.has_value());
        REQUIRE(reports->size() == 3);
        CHECK((*reports)[0].cluster_name == "prod-east");
        CHECK((*reports)[1].cluster_name == "staging");
        CHECK((*reports)[2].cluster_name == "dev");
    }

    SECTION("Streaming-written central directory offset") {
        auto data = zip_builder{}
            .stored("first.tar.gz", bundle_tgz("prod-east"))
            .stored("second.tar.gz", bundle_tgz("staging"))
            .build(true);

        auto reports = parse_bug_report(data);
        REQUIRE(reports.has_value());
        CHECK(reports->size() == 2);
    }

    SECTION("Corrupt bundle is reported with its entry name") {
        auto broken = bundle_tgz("prod-east");
        broken.resize(20);
        auto data = zip_builder{}.stored("broken.tar.gz", broken).build();

        auto reports = parse_bug_report(data);
        REQUIRE_FALSE(reports.has_value());
        CHECK(reports.error().code() == error_code::corrupt_archive);
        CHECK(reports.error().message().starts_with("broken.tar.gz: "));
    }

    SECTION("Unsupported method on a file that is not a bundle") {
        auto data = zip_builder{}
            .method("notes.bz2", to_bytes("BZh9"), 12)
            .stored("prod-east.tar.gz", bundle_tgz("prod-east"))
            .build();

        auto reports = parse_bug_report(data);
        REQUIRE(reports.has_value());
        CHECK(reports->size() == 1);
    }
}

TEST_CASE("Unsupported container", "[report]") {
    auto data = to_bytes("just a text file\n");
    auto reports = parse_bug_report(data);
    REQUIRE_FALSE(reports.has_value());
    CHECK(reports.error().code() == error_code::unsupported_container);
}

TEST_CASE("Splitting a multi-file upload", "[report]") {
    auto data = to_bytes("aaaabbbcccccc");

    send::send_metadata metadata;
    metadata.name = "upload";

    SECTION("No manifest") {
        const auto files = split_by_manifest(data, metadata);
        REQUIRE(files.size() == 1);
        CHECK(files[0].size() == data.size());
    }

    SECTION("Single-file manifest") {
        metadata.manifest = send::send_manifest{{{"only", 4}}};
        const auto files = split_by_manifest(data, metadata);
        REQUIRE(files.size() == 1);
        CHECK(files[0].size() == data.size());
    }

    SECTION("Slices in manifest order") {
        metadata.manifest = send::send_manifest{{{"a", 4}, {"b", 3}, {"c", 6}}};
        const auto files = split_by_manifest(data, metadata);
        REQUIRE(files.size() == 3);
        CHECK(to_text(files[0]) == "aaaa");
        CHECK(to_text(files[1]) == "bbb");
        CHECK(to_text(files[2]) == "cccccc");
    }

    SECTION("Slices past the end are dropped") {
        metadata.manifest = send::send_manifest{{{"a", 4}, {"b", 3}, {"c", 100}}};
        const auto files = split_by_manifest(data, metadata);
        REQUIRE(files.size() == 2);
        CHECK(to_text(files[1]) == "bbb");
    }
}

TEST_CASE("Analyze a share link", "[report]") {
    bytes secret = noise(16, 31);
    fake_send_service service{secret};

    const auto east = bundle_tgz("prod-east");
    const auto west = bundle_tgz("prod-west");
    const auto notes = to_bytes("not an archive");

    bytes payload;
    append(payload, east);
    append(payload, west);
    append(payload, notes);

    const std::string metadata_json = fmt::format(
        R"({{"name":"upload.zip","type":"application/octet-stream","size":{},"manifest":{{"files":[)"
        R"({{"name":"east.tar.gz","size":{}}},{{"name":"west.tar.gz","size":{}}},{{"name":"notes.txt","size":{}}}]}}}})",
        payload.size(), east.size(), west.size(), notes.size());
    service.publish(metadata_json, payload, false, 4096);

    SECTION("Reports and per-file failures") {
        auto analysis = analyze_share_link(service.transport, service.share_url(), "");
        REQUIRE(analysis.has_value());
        CHECK(analysis->file_count == 3);
        CHECK(analysis->metadata.name == "upload.zip");

        REQUIRE(analysis->reports.size() == 2);
        CHECK(analysis->reports[0].cluster_name == "prod-east");
        CHECK(analysis->reports[1].cluster_name == "prod-west");

        REQUIRE(analysis->failures.size() == 1);
        CHECK(analysis->failures[0].index == 2);
        CHECK(analysis->failures[0].name == "notes.txt");
        CHECK(analysis->failures[0].reason.code() == error_code::unsupported_container);
    }

    SECTION("Download failures are returned") {
        service.transport.routes.erase(service.blob_url());
        auto analysis = analyze_share_link(service.transport, service.share_url(), "");
        REQUIRE_FALSE(analysis.has_value());
        CHECK(analysis.error().code() == error_code::not_found);
    }
}
