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

#include <bugsift/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace bugsift {

namespace {

constexpr const char* LOGGER_NAME = "bugsift";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    // Reuse a registered logger so that spdlog::cfg level settings apply
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    return spdlog::stderr_color_mt(LOGGER_NAME);
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock{logger_mutex};
    if (!current_logger) {
        current_logger = make_default_logger();
    }
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard lock{logger_mutex};
    current_logger = std::move(replacement);
}

} // namespace bugsift
