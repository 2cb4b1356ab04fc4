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

#include <string_view>

namespace bugsift::k8s {

// Kubernetes CPU quantity in cores: "250m" -> 0.25, "1500000n" -> 0.0015,
// "2" -> 2. Unparseable or empty input is 0.
[[nodiscard]] double parse_cpu_cores(std::string_view quantity) noexcept;

// Kubernetes memory quantity in GiB. Binary suffixes (Ki, Mi, Gi, Ti) scale
// by 1024, decimal ones (k, M, G, T) by 1000 relative to G; a bare number is
// bytes. Unparseable or empty input is 0.
[[nodiscard]] double parse_memory_gib(std::string_view quantity) noexcept;

// Round half away from zero to the given number of decimal places
[[nodiscard]] double round_to(double value, int places) noexcept;

// Leading decimal number of the text, ignoring whatever follows it
// ("1.5abc" -> 1.5). Leading whitespace and a '+' sign are accepted.
[[nodiscard]] double parse_leading_number(std::string_view text, bool* ok = nullptr) noexcept;

} // namespace bugsift::k8s
