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

#include <bugsift/report.hpp>
#include <bugsift/bundle.hpp>
#include <bugsift/container.hpp>
#include <bugsift/log.hpp>
#include <bugsift/send/curl_transport.hpp>
#include <bugsift/zip/zip_reader.hpp>
#include <fmt/format.h>
#include <array>

namespace bugsift {

namespace {

std::expected<void, error> parse_gzip_tar(std::unique_ptr<input_stream> source,
                                          std::vector<parsed_bug_report>& reports) {
    auto files = extract_bundle_files(std::move(source));
    if (!files) {
        return std::unexpected(files.error());
    }

    logger()->debug("Bundle for cluster '{}': {} of {} members{}", files->cluster_name, files->found,
                    BUNDLE_MEMBER_COUNT, files->cancelled_early ? ", stopped early" : "");

    if (!files->has_inventory()) {
        logger()->debug("Bundle has neither nodes nor k8s-resources, no report");
        return {};
    }

    reports.push_back(build_report(*files));
    return {};
}

bool is_tar_gz_name(std::string_view name) noexcept {
    return name.ends_with(".tar.gz") || name.ends_with(".tgz");
}

std::expected<void, error> parse_zip(std::span<std::byte> buffer, std::vector<parsed_bug_report>& reports) {
    zip::repair_streaming_eocd(buffer);

    auto archive = zip::zip_reader::open(buffer);
    if (!archive) {
        return std::unexpected(archive.error());
    }

    for (const auto& entry : archive->entries()) {
        if (entry.is_directory()) {
            continue;
        }

        auto stream = archive->open_entry(entry);
        if (!stream) {
            if (!is_tar_gz_name(entry.name)) {
                logger()->debug("Skipping ZIP entry {}: {}", entry.name, stream.error().message());
                continue;
            }
            return std::unexpected(stream.error());
        }

        if (!is_tar_gz_name(entry.name)) {
            // Not named like a bundle; sniff the first bytes instead
            std::array<std::byte, 2> magic{};
            auto peek = read_fully(**stream, magic);
            if (!peek) {
                return std::unexpected(peek.error());
            }
            if (!looks_like_gzip(std::span{magic}.first(*peek))) {
                continue;
            }

            stream = archive->open_entry(entry);
            if (!stream) {
                return std::unexpected(stream.error());
            }
        }

        logger()->debug("Processing ZIP entry {} ({} bytes)", entry.name, entry.uncompressed_size);
        if (auto result = parse_gzip_tar(std::move(*stream), reports); !result) {
            return std::unexpected(error{result.error().code(),
                fmt::format("{}: {}", entry.name, result.error().message())});
        }
    }

    return {};
}

} // anonymous namespace

parsed_bug_report build_report(const bundle_files& files) {
    parsed_bug_report report;
    report.cluster_name = files.cluster_name;
    if (!files.nodes.empty()) {
        report.nodes = k8s::extract_nodes(files.cluster_name, files.nodes);
    }
    if (!files.k8s_resources.empty()) {
        report.namespace_rows = k8s::extract_namespace_rows(files.cluster_name, files.k8s_resources);
    }
    return report;
}

auto parse_bug_report(std::span<std::byte> buffer) -> std::expected<std::vector<parsed_bug_report>, error> {
    std::vector<parsed_bug_report> reports;

    switch (detect_container(buffer)) {
        case container_kind::zip:
            if (auto result = parse_zip(buffer, reports); !result) {
                return std::unexpected(result.error());
            }
            break;
        case container_kind::gzip:
            if (auto result = parse_gzip_tar(std::make_unique<memory_stream>(buffer), reports); !result) {
                return std::unexpected(result.error());
            }
            break;
        case container_kind::unsupported:
            return std::unexpected(error{error_code::unsupported_container,
                "Unsupported file format, expected .tar.gz or .zip"});
    }

    return reports;
}

std::vector<std::span<std::byte>> split_by_manifest(std::span<std::byte> data, const send::send_metadata& metadata) {
    if (!metadata.manifest || metadata.manifest->files.size() <= 1) {
        return {data};
    }

    std::vector<std::span<std::byte>> files;
    uint64_t offset = 0;
    for (const auto& file : metadata.manifest->files) {
        const uint64_t end = offset + file.size;
        if (end >= offset && end <= data.size()) {
            files.push_back(data.subspan(static_cast<size_t>(offset), static_cast<size_t>(file.size)));
        }
        offset = end;
    }
    return files;
}

auto analyze_share_link(send::http_transport &transport, std::string_view url, std::string_view password,
                        const send::client_options &options) -> std::expected<link_analysis, error> {
    auto download = send::download_from_send(transport, url, password, options);
    if (!download) {
        return std::unexpected(download.error());
    }

    link_analysis analysis;
    analysis.metadata = std::move(download->metadata);

    const auto files = split_by_manifest(download->data, analysis.metadata);
    analysis.file_count = files.size();

    const bool named = analysis.metadata.manifest && analysis.metadata.manifest->files.size() > 1;
    if (named) {
        logger()->info("Split archive into {} of {} listed files", files.size(),
                       analysis.metadata.manifest->files.size());
    }
    for (size_t i = 0; i < files.size(); ++i) {
        auto parsed = parse_bug_report(files[i]);
        if (!parsed) {
            std::string name = named && i < analysis.metadata.manifest->files.size()
                ? analysis.metadata.manifest->files[i].name
                : analysis.metadata.name;
            logger()->warn("Failed to parse file {} ({}), continuing: {}", i, name, parsed.error().message());
            analysis.failures.push_back(file_failure{i, std::move(name), parsed.error()});
            continue;
        }

        for (auto& report : *parsed) {
            analysis.reports.push_back(std::move(report));
        }
    }

    logger()->info("Parsed {} cluster reports from {} files", analysis.reports.size(), files.size());
    return analysis;
}

auto analyze_share_link(std::string_view url, std::string_view password, const send::client_options &options)
    -> std::expected<link_analysis, error> {
    send::curl_transport transport{options};
    return analyze_share_link(transport, url, password, options);
}

} // namespace bugsift
