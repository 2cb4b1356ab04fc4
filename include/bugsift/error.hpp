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

#include <expected>
#include <string>
#include <string_view>

namespace bugsift {

enum class error_code {
    // Share link download
    malformed_url,
    not_found,
    protocol_mismatch,
    decryption_failed,
    transport_error,

    // Containers and archives
    unsupported_container,
    invalid_header,
    corrupt_archive,
    io_error,
    unsupported_feature,
    invalid_operation,
    end_of_archive,
    cancelled
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

// Only network-level failures are worth retrying; everything else means the
// link is bad or the upstream protocol changed.
[[nodiscard]] inline bool is_retryable(const error& err) noexcept {
    return err.code() == error_code::transport_error;
}

} // namespace bugsift
