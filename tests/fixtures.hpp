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

#include <bugsift/send/crypto.hpp>
#include <bugsift/send/ece.hpp>
#include <bugsift/send/http.hpp>
#include <bugsift/stream.hpp>
#include <bugsift/tar/header_parser.hpp>
#include <fmt/format.h>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// In-memory builders for the archives and services the tests run against

namespace bugsift::testing {

using bytes = std::vector<std::byte>;

inline bytes to_bytes(std::string_view text) {
    const auto view = std::as_bytes(std::span{text.data(), text.size()});
    return {view.begin(), view.end()};
}

inline std::string to_text(std::span<const std::byte> data) {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

inline void append(bytes& out, std::span<const std::byte> data) {
    out.insert(out.end(), data.begin(), data.end());
}

// Deterministic bytes that deflate cannot shrink much
inline bytes noise(const size_t size, uint32_t seed = 12345) {
    bytes out(size);
    for (auto& b : out) {
        seed = seed * 1103515245u + 12345u;
        b = static_cast<std::byte>((seed >> 16) & 0xFF);
    }
    return out;
}

// Stream that hands back at most max_chunk bytes per read, the way a
// decompressor or a socket does
class chunked_stream : public input_stream {
private:
    bytes data_;
    size_t max_chunk_;
    size_t position_ = 0;

public:
    chunked_stream(bytes data, const size_t max_chunk) : data_(std::move(data)), max_chunk_(max_chunk) {}

    std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        const size_t to_read = std::min({buffer.size(), max_chunk_, data_.size() - position_});
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), to_read, buffer.begin());
        position_ += to_read;
        return to_read;
    }

    std::expected<void, error> skip(size_t bytes) override {
        return skip_by_reading(*this, bytes);
    }

    bool at_end() const override {
        return position_ >= data_.size();
    }
};

// ustar writer
class tar_builder {
private:
    bytes data_;

    static void put(std::array<std::byte, 512>& block, const size_t offset, std::string_view text) {
        if (text.empty()) {
            return;
        }
        std::memcpy(block.data() + offset, text.data(), text.size());
    }

    static void put_octal(std::array<std::byte, 512>& block, const size_t offset, const size_t width,
                          const uint64_t value) {
        put(block, offset, fmt::format("{:0{}o}", value, width - 1));
    }

    void add_padded(std::span<const std::byte> content) {
        append(data_, content);
        const size_t padding = (512 - content.size() % 512) % 512;
        data_.insert(data_.end(), padding, std::byte{0});
    }

public:
    static std::array<std::byte, 512> header(std::string_view name, const uint64_t size, const char typeflag,
                                             std::string_view prefix = {}) {
        std::array<std::byte, 512> block{};
        put(block, 0, name.substr(0, 100));
        put_octal(block, 100, 8, 0644);
        put_octal(block, 108, 8, 1000);
        put_octal(block, 116, 8, 1000);
        put_octal(block, 124, 12, size);
        put_octal(block, 136, 12, 1700000000);
        block[156] = static_cast<std::byte>(typeflag);
        put(block, 257, std::string_view{"ustar\0", 6});
        put(block, 263, "00");
        put(block, 265, "builder");
        put(block, 297, "builder");
        put(block, 345, prefix.substr(0, 155));

        const auto checksum = tar::detail::calculate_checksum(block);
        put(block, 148, fmt::format("{:06o}", checksum));
        block[154] = std::byte{0};
        block[155] = std::byte{' '};
        return block;
    }

    tar_builder& file(std::string_view path, std::string_view content) {
        return file(path, to_bytes(content));
    }

    tar_builder& file(std::string_view path, std::span<const std::byte> content) {
        append(data_, header(path, content.size(), '0'));
        add_padded(content);
        return *this;
    }

    tar_builder& directory(std::string_view path) {
        append(data_, header(path, 0, '5'));
        return *this;
    }

    tar_builder& symlink(std::string_view path) {
        append(data_, header(path, 0, '2'));
        return *this;
    }

    // GNU 'L' record followed by the entry under a truncated name
    tar_builder& gnu_long_file(std::string_view path, std::string_view content) {
        std::string name{path};
        name.push_back('\0');
        append(data_, header("././@LongLink", name.size(), 'L'));
        add_padded(to_bytes(name));
        return file(path.substr(0, 99), content);
    }

    // PAX 'x' record carrying the path
    tar_builder& pax_file(std::string_view path, std::string_view content) {
        const std::string body = fmt::format(" path={}\n", path);
        // The length prefix counts itself
        size_t length = body.size() + 1;
        while (fmt::format("{}", length).size() + body.size() != length) {
            ++length;
        }
        const std::string record = fmt::format("{}{}", length, body);

        append(data_, header("PaxHeaders/entry", record.size(), 'x'));
        add_padded(to_bytes(record));
        return file("placeholder", content);
    }

    tar_builder& raw(std::span<const std::byte> block) {
        append(data_, block);
        return *this;
    }

    // Archive with the two terminating zero blocks
    [[nodiscard]] bytes build() const {
        bytes out = data_;
        out.insert(out.end(), 1024, std::byte{0});
        return out;
    }

    // Archive that just stops after the last entry
    [[nodiscard]] bytes build_without_trailer() const {
        return data_;
    }
};

inline bytes deflate_with(std::span<const std::byte> input, const int window_bits) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    bytes out(deflateBound(&zs, static_cast<uLong>(input.size())));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish");
    }
    out.resize(zs.total_out);
    return out;
}

inline bytes gzip(std::span<const std::byte> input) {
    return deflate_with(input, 15 + 16);
}

inline bytes raw_deflate(std::span<const std::byte> input) {
    return deflate_with(input, -15);
}

inline void put_le16(bytes& out, const uint16_t value) {
    out.push_back(static_cast<std::byte>(value & 0xFF));
    out.push_back(static_cast<std::byte>(value >> 8));
}

inline void put_le32(bytes& out, const uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
    }
}

// ZIP writer with stored or deflated entries and no data descriptors
class zip_builder {
private:
    struct pending_entry {
        std::string name;
        bytes content;
        uint16_t method;
    };

    std::vector<pending_entry> entries_;

public:
    zip_builder& stored(std::string_view name, std::span<const std::byte> content) {
        entries_.push_back({std::string{name}, bytes(content.begin(), content.end()), 0});
        return *this;
    }

    zip_builder& deflated(std::string_view name, std::span<const std::byte> content) {
        entries_.push_back({std::string{name}, bytes(content.begin(), content.end()), 8});
        return *this;
    }

    zip_builder& method(std::string_view name, std::span<const std::byte> content, const uint16_t method) {
        entries_.push_back({std::string{name}, bytes(content.begin(), content.end()), method});
        return *this;
    }

    zip_builder& directory(std::string_view name) {
        entries_.push_back({std::string{name}, {}, 0});
        return *this;
    }

    // wrong_cd_offset writes 0 into the EOCD directory offset, as some
    // streaming writers do
    [[nodiscard]] bytes build(const bool wrong_cd_offset = false) const {
        bytes out;
        bytes central;

        for (const auto& entry : entries_) {
            const bytes payload = entry.method == 8 ? raw_deflate(entry.content) : entry.content;
            const auto crc = static_cast<uint32_t>(
                crc32(0, reinterpret_cast<const Bytef*>(entry.content.data()), static_cast<uInt>(entry.content.size())));
            const auto local_offset = static_cast<uint32_t>(out.size());

            put_le32(out, 0x04034b50);
            put_le16(out, 20);
            put_le16(out, 0);
            put_le16(out, entry.method);
            put_le16(out, 0);
            put_le16(out, 0);
            put_le32(out, crc);
            put_le32(out, static_cast<uint32_t>(payload.size()));
            put_le32(out, static_cast<uint32_t>(entry.content.size()));
            put_le16(out, static_cast<uint16_t>(entry.name.size()));
            put_le16(out, 0);
            append(out, to_bytes(entry.name));
            append(out, payload);

            put_le32(central, 0x02014b50);
            put_le16(central, 20);
            put_le16(central, 20);
            put_le16(central, 0);
            put_le16(central, entry.method);
            put_le16(central, 0);
            put_le16(central, 0);
            put_le32(central, crc);
            put_le32(central, static_cast<uint32_t>(payload.size()));
            put_le32(central, static_cast<uint32_t>(entry.content.size()));
            put_le16(central, static_cast<uint16_t>(entry.name.size()));
            put_le16(central, 0);
            put_le16(central, 0);
            put_le16(central, 0);
            put_le16(central, 0);
            put_le32(central, 0);
            put_le32(central, local_offset);
            append(central, to_bytes(entry.name));
        }

        const auto cd_offset = static_cast<uint32_t>(out.size());
        append(out, central);

        put_le32(out, 0x06054b50);
        put_le16(out, 0);
        put_le16(out, 0);
        put_le16(out, static_cast<uint16_t>(entries_.size()));
        put_le16(out, static_cast<uint16_t>(entries_.size()));
        put_le32(out, static_cast<uint32_t>(central.size()));
        put_le32(out, wrong_cd_offset ? 0 : cd_offset);
        put_le16(out, 0);
        return out;
    }
};

struct fake_route {
    long status = 200;
    send::header_list headers;
    std::string body;
};

// Serves canned responses by URL and records every request. Streamed
// bodies are delivered in chunk_size slices.
class fake_transport : public send::http_transport {
public:
    std::map<std::string, fake_route> routes;
    std::vector<send::http_request> requests;
    size_t chunk_size = 1000;
    std::optional<error> network_failure;

    std::expected<send::http_response, error> get(const send::http_request& request) override {
        requests.push_back(request);
        if (network_failure) {
            return std::unexpected(*network_failure);
        }

        const auto it = routes.find(request.url);
        if (it == routes.end()) {
            return send::http_response{404, {}, "Not Found"};
        }
        return send::http_response{it->second.status, it->second.headers, it->second.body};
    }

    std::expected<send::http_response, error> get_streaming(
        const send::http_request& request, const send::body_sink& sink) override {
        auto response = get(request);
        if (!response || !response->ok()) {
            return response;
        }

        const auto body = send::crypto::as_bytes(response->body);
        for (size_t offset = 0; offset < body.size(); offset += chunk_size) {
            if (auto result = sink(body.subspan(offset, std::min(chunk_size, body.size() - offset))); !result) {
                return std::unexpected(result.error());
            }
        }
        response->body.clear();
        return response;
    }

    [[nodiscard]] const send::http_request* last_request_to(std::string_view url) const {
        const send::http_request* found = nullptr;
        for (const auto& request : requests) {
            if (request.url == url) {
                found = &request;
            }
        }
        return found;
    }
};

[[nodiscard]] inline std::optional<std::string> header_value(const send::http_request& request,
                                                             std::string_view name) {
    for (const auto& [key, value] : request.headers) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

// A share-link service in memory: publishes one encrypted file with the
// given metadata and hands out nonce_1 on the page, nonce_2 with the
// metadata response
struct fake_send_service {
    static constexpr std::string_view BASE = "https://send.example.com";
    static constexpr std::string_view FILE_ID = "a1b2c3d4e5";
    static constexpr std::string_view NONCE_1 = "yRCdyQ1EMSA3mo4rqSkuNQ==";
    static constexpr std::string_view NONCE_2 = "n0yx5aqBtCWy6SyC2kpHdw==";

    bytes secret;
    fake_transport transport;

    explicit fake_send_service(bytes url_secret) : secret(std::move(url_secret)) {}

    [[nodiscard]] std::string share_url() const {
        return fmt::format("{}/download/{}/#{}", BASE, FILE_ID, send::crypto::base64url_encode(secret));
    }

    [[nodiscard]] std::string page_url() const { return fmt::format("{}/download/{}/", BASE, FILE_ID); }
    [[nodiscard]] std::string metadata_url() const { return fmt::format("{}/api/metadata/{}", BASE, FILE_ID); }
    [[nodiscard]] std::string blob_url() const { return fmt::format("{}/api/download/blob/{}", BASE, FILE_ID); }

    void publish(std::string_view metadata_json, std::span<const std::byte> payload,
                 const bool requires_password = false, const uint32_t record_size = 1024) {
        transport.routes[page_url()] = fake_route{200, {},
            fmt::format("<html><script>\nwindow.downloadMetadata = {{\"nonce\":\"{}\",\"pwd\":{}}};\n</script></html>",
                        NONCE_1, requires_password ? "true" : "false")};

        auto metadata_key = send::crypto::hkdf_sha256(secret, {}, "metadata", send::crypto::AES128_KEY_SIZE);
        const std::array<std::byte, send::crypto::GCM_IV_SIZE> zero_iv{};
        auto sealed = send::crypto::aes128gcm_encrypt(*metadata_key, zero_iv, send::crypto::as_bytes(metadata_json));
        transport.routes[metadata_url()] = fake_route{200,
            {{"Content-Type", "application/json"}, {"WWW-Authenticate", fmt::format("send-v1 {}", NONCE_2)}},
            fmt::format("{{\"metadata\":\"{}\"}}", send::crypto::base64_encode(*sealed))};

        const auto salt = noise(send::ECE_SALT_SIZE, 99);
        auto blob = send::ece_encrypt(secret, salt, payload, record_size);
        transport.routes[blob_url()] = fake_route{200, {}, to_text(*blob)};
    }
};

} // namespace bugsift::testing
