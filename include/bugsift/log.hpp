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

#include <spdlog/spdlog.h>
#include <memory>

namespace bugsift {

// Library-wide logger named "bugsift". Created on first use with a stderr
// sink unless the host application installed its own.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Replace the library logger, e.g. to route into the host's sinks.
// Passing nullptr restores the default.
void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace bugsift
