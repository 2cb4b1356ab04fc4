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

#include <bugsift/send/ece.hpp>
#include <cstddef>
#include <string>

namespace bugsift::send {

struct client_options {
    std::string user_agent = "bugsift/1.0";
    bool verify_tls = true;
    std::string ca_bundle;          // Empty: the system CA store
    size_t max_record_size = ECE_DEFAULT_MAX_RECORD_SIZE;
};

} // namespace bugsift::send
