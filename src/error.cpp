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

#include <bugsift/error.hpp>

namespace bugsift {

std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::malformed_url: return "malformed_url";
        case error_code::not_found: return "not_found";
        case error_code::protocol_mismatch: return "protocol_mismatch";
        case error_code::decryption_failed: return "decryption_failed";
        case error_code::transport_error: return "transport_error";
        case error_code::unsupported_container: return "unsupported_container";
        case error_code::invalid_header: return "invalid_header";
        case error_code::corrupt_archive: return "corrupt_archive";
        case error_code::io_error: return "io_error";
        case error_code::unsupported_feature: return "unsupported_feature";
        case error_code::invalid_operation: return "invalid_operation";
        case error_code::end_of_archive: return "end_of_archive";
        case error_code::cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace bugsift
