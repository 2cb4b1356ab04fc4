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

#include <bugsift/k8s/quantity.hpp>
#include <charconv>
#include <cmath>
#include <cctype>

namespace bugsift::k8s {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// Value of the number in front of a unit suffix, 0 when there is none
double scaled(std::string_view number, const double factor) noexcept {
    bool ok = false;
    const double value = parse_leading_number(number, &ok);
    return ok ? value * factor : 0.0;
}

} // anonymous namespace

double parse_leading_number(std::string_view text, bool* ok) noexcept {
    text = trim(text);
    if (text.starts_with('+')) {
        text.remove_prefix(1);
    }

    double value = 0.0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    const bool parsed = ec == std::errc{} && end != text.data() && std::isfinite(value);
    if (ok) {
        *ok = parsed;
    }
    return parsed ? value : 0.0;
}

double parse_cpu_cores(std::string_view quantity) noexcept {
    const auto text = trim(quantity);
    if (text.empty()) {
        return 0.0;
    }

    if (text.ends_with('m')) {
        return scaled(text.substr(0, text.size() - 1), 1.0 / 1000.0);
    }
    if (text.ends_with('n')) {
        return scaled(text.substr(0, text.size() - 1), 1.0 / 1'000'000'000.0);
    }
    return scaled(text, 1.0);
}

double parse_memory_gib(std::string_view quantity) noexcept {
    const auto text = trim(quantity);
    if (text.empty()) {
        return 0.0;
    }

    struct unit {
        std::string_view suffix;
        double factor;
    };

    // Two-letter binary suffixes must be tried before their one-letter tails
    constexpr unit units[] = {
        {"Ki", 1.0 / (1024.0 * 1024.0)},
        {"Mi", 1.0 / 1024.0},
        {"Gi", 1.0},
        {"Ti", 1024.0},
        {"k", 1.0 / 1'000'000.0},
        {"M", 1.0 / 1000.0},
        {"G", 1.0},
        {"T", 1000.0},
    };

    for (const auto& [suffix, factor] : units) {
        if (text.ends_with(suffix)) {
            return scaled(text.substr(0, text.size() - suffix.size()), factor);
        }
    }

    return scaled(text, 1.0 / (1024.0 * 1024.0 * 1024.0));
}

double round_to(const double value, const int places) noexcept {
    const double factor = std::pow(10.0, places);
    return std::round(value * factor) / factor;
}

} // namespace bugsift::k8s
