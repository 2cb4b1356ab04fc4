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

#include <catch2/catch_test_macros.hpp>
#include <bugsift/send/client.hpp>
#include "fixtures.hpp"

using namespace bugsift;
using namespace bugsift::send;
using namespace bugsift::testing;

namespace {

// Secret 00..0f; the expected signatures were computed independently
const bytes URL_SECRET = [] {
    bytes out;
    for (int i = 0; i < 16; ++i) {
        out.push_back(static_cast<std::byte>(i));
    }
    return out;
}();

constexpr std::string_view SIGNED_NONCE_1 = "send-v1 8w2+q1zkV6lo/Jk70A7OvrgcC96lHKub9m/N8Hh507s=";
constexpr std::string_view SIGNED_NONCE_2 = "send-v1 qV45wuBZivL7q1wP/jnU2EHksUf0mvGxmnd0G4M4rZ4=";
constexpr std::string_view PASSWORD_SIGNED_NONCE_1 = "send-v1 hcFFHopq8nNOWw8W/ufR0KNTkeNgZaiFhuqgi0QvCmg=";

constexpr std::string_view METADATA_JSON =
    R"({"name":"bundle.tar.gz","type":"application/gzip","size":5000,)"
    R"("manifest":{"files":[{"name":"bundle.tar.gz","size":5000}]}})";

std::optional<std::string> authorization_for(const fake_transport& transport, const std::string& url) {
    const auto* request = transport.last_request_to(url);
    if (!request) {
        return std::nullopt;
    }
    return header_value(*request, "Authorization");
}

} // anonymous namespace

TEST_CASE("Embedded download metadata", "[client]") {
    using detail::find_download_metadata;

    CHECK(find_download_metadata("<script>window.downloadMetadata = {\"nonce\":\"abc\"};</script>") ==
          "{\"nonce\":\"abc\"}");
    CHECK(find_download_metadata("downloadMetadata={\"a\":{\"b\":1}};var x = {};") == "{\"a\":{\"b\":1}}");
    CHECK(find_download_metadata("var downloadMetadataUrl = '/x'; downloadMetadata = {\"n\":1}") == "{\"n\":1}");
    CHECK_FALSE(find_download_metadata("<html>nothing to see</html>").has_value());
    CHECK_FALSE(find_download_metadata("downloadMetadata = null;").has_value());
}

TEST_CASE("Decrypted metadata JSON", "[client]") {
    SECTION("With manifest") {
        auto metadata = detail::parse_metadata_json(METADATA_JSON);
        REQUIRE(metadata.has_value());
        CHECK(metadata->name == "bundle.tar.gz");
        CHECK(metadata->type == "application/gzip");
        CHECK(metadata->size == 5000);
        REQUIRE(metadata->manifest.has_value());
        REQUIRE(metadata->manifest->files.size() == 1);
        CHECK(metadata->manifest->files[0].size == 5000);
    }

    SECTION("Without manifest") {
        auto metadata = detail::parse_metadata_json(R"({"name": "x.zip", "size": 10})");
        REQUIRE(metadata.has_value());
        CHECK(metadata->name == "x.zip");
        CHECK(metadata->type.empty());
        CHECK_FALSE(metadata->manifest.has_value());
    }

    SECTION("Not JSON") {
        auto metadata = detail::parse_metadata_json("[1, 2");
        REQUIRE_FALSE(metadata.has_value());
        CHECK(metadata.error().code() == error_code::protocol_mismatch);
    }

    SECTION("Not an object") {
        auto metadata = detail::parse_metadata_json("[1, 2]");
        REQUIRE_FALSE(metadata.has_value());
        CHECK(metadata.error().code() == error_code::protocol_mismatch);
    }
}

TEST_CASE("Auth scheme tag", "[client]") {
    CHECK(detail::strip_auth_scheme("send-v1 abc==") == "abc==");
    CHECK(detail::strip_auth_scheme("send-v1 abc==\r\n") == "abc==");
    CHECK(detail::strip_auth_scheme("abc==") == "abc==");
}

TEST_CASE("Request signatures", "[client]") {
    const std::string canonical = fmt::format("https://send.example.com/download/a1b2c3d4e5/#{}",
                                              crypto::base64url_encode(URL_SECRET));
    auto locator = parse_share_url(canonical);
    REQUIRE(locator.has_value());

    SECTION("Secret-derived key") {
        auto key = derive_auth_key(*locator, canonical, "", false);
        REQUIRE(key.has_value());

        auto header = build_auth_header(*key, fake_send_service::NONCE_1);
        REQUIRE(header.has_value());
        CHECK(*header == SIGNED_NONCE_1);
    }

    SECTION("Password-derived key salted with the link") {
        auto key = derive_auth_key(*locator, canonical, "hunter2", true);
        REQUIRE(key.has_value());

        auto header = build_auth_header(*key, fake_send_service::NONCE_1);
        REQUIRE(header.has_value());
        CHECK(*header == PASSWORD_SIGNED_NONCE_1);
    }

    SECTION("A password the link does not ask for is ignored") {
        auto key = derive_auth_key(*locator, canonical, "hunter2", false);
        REQUIRE(key.has_value());
        CHECK(*build_auth_header(*key, fake_send_service::NONCE_1) == SIGNED_NONCE_1);
    }

    SECTION("Missing password falls back to the secret") {
        auto key = derive_auth_key(*locator, canonical, "", true);
        REQUIRE(key.has_value());
        CHECK(*build_auth_header(*key, fake_send_service::NONCE_1) == SIGNED_NONCE_1);
    }

    SECTION("Nonce must be base64") {
        auto key = derive_auth_key(*locator, canonical, "", false);
        REQUIRE(key.has_value());
        auto header = build_auth_header(*key, "not base64!");
        REQUIRE_FALSE(header.has_value());
        CHECK(header.error().code() == error_code::protocol_mismatch);
    }
}

TEST_CASE("Download and decrypt a shared file", "[client]") {
    fake_send_service service{URL_SECRET};
    const auto payload = noise(5000, 21);
    service.publish(METADATA_JSON, payload);

    auto result = download_from_send(service.transport, service.share_url(), "");
    REQUIRE(result.has_value());
    CHECK(result->data == payload);
    CHECK(result->metadata.name == "bundle.tar.gz");
    CHECK(result->metadata.size == 5000);

    REQUIRE(service.transport.requests.size() == 3);
    CHECK(service.transport.requests[0].url == service.page_url());
    CHECK(service.transport.requests[1].url == service.metadata_url());
    CHECK(service.transport.requests[2].url == service.blob_url());

    // The page request is anonymous; the blob is signed with the nonce the
    // metadata response handed out
    CHECK_FALSE(header_value(service.transport.requests[0], "Authorization").has_value());
    CHECK(authorization_for(service.transport, service.metadata_url()) == SIGNED_NONCE_1);
    CHECK(authorization_for(service.transport, service.blob_url()) == SIGNED_NONCE_2);
}

TEST_CASE("Password-protected link", "[client]") {
    fake_send_service service{URL_SECRET};
    service.publish(METADATA_JSON, noise(100, 1), true);

    auto result = download_from_send(service.transport, service.share_url(), "hunter2");
    REQUIRE(result.has_value());
    CHECK(authorization_for(service.transport, service.metadata_url()) == PASSWORD_SIGNED_NONCE_1);
}

TEST_CASE("Shell-escaped link downloads", "[client]") {
    fake_send_service service{URL_SECRET};
    service.publish(METADATA_JSON, to_bytes("payload"));

    std::string escaped = service.share_url();
    escaped.insert(escaped.find('#'), "\\");

    auto result = download_from_send(service.transport, escaped, "");
    REQUIRE(result.has_value());
    CHECK(to_text(result->data) == "payload");
}

TEST_CASE("Nonce is reused when no new one is issued", "[client]") {
    fake_send_service service{URL_SECRET};
    service.publish(METADATA_JSON, to_bytes("payload"));
    service.transport.routes[service.metadata_url()].headers.clear();

    auto result = download_from_send(service.transport, service.share_url(), "");
    REQUIRE(result.has_value());
    CHECK(authorization_for(service.transport, service.blob_url()) == SIGNED_NONCE_1);
}

TEST_CASE("Download failures", "[client]") {
    fake_send_service service{URL_SECRET};
    service.publish(METADATA_JSON, noise(3000, 2));

    const auto expect_failure = [&](const error_code code) {
        auto result = download_from_send(service.transport, service.share_url(), "");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == code);
    };

    SECTION("Malformed link makes no requests") {
        auto result = download_from_send(service.transport, "https://send.example.com/nothing", "");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::malformed_url);
        CHECK(service.transport.requests.empty());
    }

    SECTION("Unknown file") {
        service.transport.routes.erase(service.page_url());
        expect_failure(error_code::not_found);
    }

    SECTION("Expired file") {
        service.transport.routes[service.page_url()].body =
            "<script>downloadMetadata = {\"status\":404};</script>";
        expect_failure(error_code::not_found);
    }

    SECTION("Page without metadata") {
        service.transport.routes[service.page_url()].body = "<html>maintenance</html>";
        expect_failure(error_code::protocol_mismatch);
    }

    SECTION("Page without nonce") {
        service.transport.routes[service.page_url()].body = "<script>downloadMetadata = {\"pwd\":false};</script>";
        expect_failure(error_code::protocol_mismatch);
    }

    SECTION("Server error on the page") {
        service.transport.routes[service.page_url()].status = 502;
        expect_failure(error_code::transport_error);
    }

    SECTION("Rejected signature") {
        service.transport.routes[service.metadata_url()].status = 401;
        expect_failure(error_code::protocol_mismatch);
    }

    SECTION("Metadata server error") {
        service.transport.routes[service.metadata_url()].status = 500;
        expect_failure(error_code::transport_error);
    }

    SECTION("Metadata sealed with another key") {
        fake_send_service other{noise(16, 5)};
        other.publish(METADATA_JSON, noise(10, 1));
        service.transport.routes[service.metadata_url()].body = other.transport.routes[other.metadata_url()].body;
        expect_failure(error_code::decryption_failed);
    }

    SECTION("Metadata response without metadata") {
        service.transport.routes[service.metadata_url()].body = "{}";
        expect_failure(error_code::protocol_mismatch);
    }

    SECTION("Blob gone") {
        service.transport.routes.erase(service.blob_url());
        expect_failure(error_code::not_found);
    }

    SECTION("Blob tampered") {
        auto& body = service.transport.routes[service.blob_url()].body;
        body[body.size() / 2] ^= 0x20;
        expect_failure(error_code::decryption_failed);
    }

    SECTION("Network failure") {
        service.transport.network_failure = error{error_code::transport_error, "connection refused"};
        expect_failure(error_code::transport_error);
    }
}

TEST_CASE("Response header lookup", "[client]") {
    http_response response;
    response.headers = {{"www-authenticate", "send-v1 old"}, {"Content-Type", "text/html"},
                        {"WWW-Authenticate", "send-v1 new"}};

    CHECK(response.header("WWW-Authenticate") == "send-v1 new");
    CHECK(response.header("content-type") == "text/html");
    CHECK_FALSE(response.header("Location").has_value());
}
