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

#include <cstddef>
#include <span>
#include <string_view>

namespace bugsift {

enum class container_kind {
    gzip,
    zip,
    unsupported
};

// Sniff the container from its leading magic bytes
[[nodiscard]] container_kind detect_container(std::span<const std::byte> data) noexcept;

[[nodiscard]] bool looks_like_gzip(std::span<const std::byte> data) noexcept;

[[nodiscard]] std::string_view to_string(container_kind kind) noexcept;

} // namespace bugsift
