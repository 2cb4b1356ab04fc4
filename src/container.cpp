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

#include <bugsift/container.hpp>
#include <algorithm>
#include <array>
#include <ranges>

namespace bugsift {

namespace {

constexpr std::array GZIP_MAGIC{std::byte{0x1f}, std::byte{0x8b}};
constexpr std::array ZIP_MAGIC{std::byte{0x50}, std::byte{0x4b}, std::byte{0x03}, std::byte{0x04}};

template<size_t N>
bool starts_with(std::span<const std::byte> data, const std::array<std::byte, N>& magic) noexcept {
    return data.size() >= N && std::ranges::equal(data.first(N), magic);
}

} // anonymous namespace

bool looks_like_gzip(std::span<const std::byte> data) noexcept {
    return starts_with(data, GZIP_MAGIC);
}

container_kind detect_container(std::span<const std::byte> data) noexcept {
    if (starts_with(data, GZIP_MAGIC)) {
        return container_kind::gzip;
    }
    if (starts_with(data, ZIP_MAGIC)) {
        return container_kind::zip;
    }
    return container_kind::unsupported;
}

std::string_view to_string(const container_kind kind) noexcept {
    switch (kind) {
        case container_kind::gzip: return "gzip";
        case container_kind::zip: return "zip";
        case container_kind::unsupported: return "unsupported";
    }
    return "unknown";
}

} // namespace bugsift
