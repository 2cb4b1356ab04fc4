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

#include <bugsift/bundle.hpp>
#include <bugsift/inflate_stream.hpp>
#include <bugsift/log.hpp>
#include <bugsift/tar/archive_reader.hpp>
#include <bitset>

namespace bugsift {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

void store_member(bundle_files& files, const bundle_member member, std::string content) {
    switch (member) {
        case bundle_member::cluster_context:
            files.cluster_name = first_line_trimmed(content);
            files.cluster_context = std::move(content);
            break;
        case bundle_member::nodes:
            files.nodes = std::move(content);
            break;
        case bundle_member::k8s_resources:
            files.k8s_resources = std::move(content);
            break;
    }
}

} // anonymous namespace

std::optional<bundle_member> match_bundle_member(std::string_view path) noexcept {
    const auto last_slash = path.rfind('/');
    if (last_slash == std::string_view::npos) {
        return std::nullopt;
    }

    const auto file_name = path.substr(last_slash + 1);
    const auto parent_path = path.substr(0, last_slash);
    const auto parent_slash = parent_path.rfind('/');
    const auto parent_dir = parent_slash == std::string_view::npos
        ? parent_path
        : parent_path.substr(parent_slash + 1);

    if (parent_dir != "cluster") {
        return std::nullopt;
    }

    if (file_name == "cluster-context") {
        return bundle_member::cluster_context;
    }
    if (file_name == "nodes") {
        return bundle_member::nodes;
    }
    if (file_name == "k8s-resources") {
        return bundle_member::k8s_resources;
    }
    return std::nullopt;
}

std::string first_line_trimmed(std::string_view text) {
    const auto body = trim(text);
    return std::string{trim(body.substr(0, body.find('\n')))};
}

auto extract_bundle_files(std::unique_ptr<input_stream> gzip_source) -> std::expected<bundle_files, error> {
    auto inflater_result = inflate_stream::create(std::move(gzip_source), compression_format::gzip);
    if (!inflater_result) {
        return std::unexpected(inflater_result.error());
    }

    // The reader owns the inflater; keep a handle so it can be stopped
    inflate_stream* inflater = inflater_result->get();
    auto reader_result = tar::archive_reader::from_stream(std::move(*inflater_result));
    if (!reader_result) {
        return std::unexpected(reader_result.error());
    }
    auto& reader = *reader_result;

    bundle_files files;
    std::bitset<BUNDLE_MEMBER_COUNT> seen;

    while (!seen.all()) {
        auto entry_result = reader.next_entry();
        if (!entry_result) {
            return std::unexpected(entry_result.error());
        }
        if (!*entry_result) {
            break;
        }

        const auto& entry = **entry_result;
        if (!entry.is_regular_file()) {
            continue;
        }

        const auto member = match_bundle_member(entry.path());
        if (!member) {
            continue;
        }

        auto content = entry.read_all();
        if (!content) {
            return std::unexpected(content.error());
        }

        logger()->debug("Found bundle member {} ({} bytes)", entry.path(), content->size());
        store_member(files, *member, std::move(*content));
        seen.set(static_cast<size_t>(*member));
    }

    files.found = seen.count();

    if (seen.all() && !reader.finished()) {
        const auto decompressed = inflater->total_out();
        inflater->close();
        reader.close();
        files.cancelled_early = true;
        logger()->debug("All bundle members found, stopped after {} decompressed bytes", decompressed);
    }

    return files;
}

auto extract_bundle_files(std::span<const std::byte> gzip_data) -> std::expected<bundle_files, error> {
    return extract_bundle_files(std::make_unique<memory_stream>(gzip_data));
}

} // namespace bugsift
