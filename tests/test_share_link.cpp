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
#include <bugsift/send/share_link.hpp>
#include "fixtures.hpp"

using namespace bugsift;
using namespace bugsift::send;
using namespace bugsift::testing;

TEST_CASE("Parse a share link", "[share_link]") {
    auto locator = parse_share_url("https://send.example.com/download/a1b2c3d4e5/#AAECAwQFBgcICQoLDA0ODw");
    REQUIRE(locator.has_value());

    CHECK(locator->base_url == "https://send.example.com");
    CHECK(locator->file_id == "a1b2c3d4e5");
    REQUIRE(locator->url_secret.size() == 16);
    CHECK(locator->url_secret[0] == std::byte{0x00});
    CHECK(locator->url_secret[15] == std::byte{0x0f});

    CHECK(locator->download_page_url() == "https://send.example.com/download/a1b2c3d4e5/");
    CHECK(locator->metadata_url() == "https://send.example.com/api/metadata/a1b2c3d4e5");
    CHECK(locator->blob_url() == "https://send.example.com/api/download/blob/a1b2c3d4e5");
}

TEST_CASE("Share link variants", "[share_link]") {
    SECTION("Port is kept") {
        auto locator = parse_share_url("http://localhost:1443/download/abc_-9/#AAECAw");
        REQUIRE(locator.has_value());
        CHECK(locator->base_url == "http://localhost:1443");
        CHECK(locator->file_id == "abc_-9");
    }

    SECTION("Padded secret") {
        auto locator = parse_share_url("https://send.example.com/download/f1/#AAECAw==");
        REQUIRE(locator.has_value());
        CHECK(locator->url_secret.size() == 4);
    }

    SECTION("No trailing slash") {
        auto locator = parse_share_url("https://send.example.com/download/f1#AAECAw");
        REQUIRE(locator.has_value());
        CHECK(locator->file_id == "f1");
    }
}

TEST_CASE("Malformed share links", "[share_link]") {
    const auto check_malformed = [](std::string_view url) {
        auto locator = parse_share_url(url);
        REQUIRE_FALSE(locator.has_value());
        CHECK(locator.error().code() == error_code::malformed_url);
    };

    SECTION("Not a URL") {
        check_malformed("definitely not a link");
    }

    SECTION("No file id") {
        check_malformed("https://send.example.com/upload/#AAECAw");
    }

    SECTION("Empty file id") {
        check_malformed("https://send.example.com/download//#AAECAw");
    }

    SECTION("No fragment") {
        check_malformed("https://send.example.com/download/a1b2c3/");
    }

    SECTION("Secret is not base64url") {
        check_malformed("https://send.example.com/download/a1b2c3/#not*valid");
    }
}

TEST_CASE("Shell-escaped fragment markers are canonicalized", "[share_link]") {
    CHECK(canonicalize_share_url("https://send.example.com/download/a1/\\#AAECAw") ==
          "https://send.example.com/download/a1/#AAECAw");
    CHECK(canonicalize_share_url("https://send.example.com/download/a1/#AAECAw") ==
          "https://send.example.com/download/a1/#AAECAw");
    // Only "\#" is touched
    CHECK(canonicalize_share_url("a\\b") == "a\\b");

    auto locator = parse_share_url(canonicalize_share_url("https://send.example.com/download/a1/\\#AAECAw"));
    REQUIRE(locator.has_value());
    CHECK(locator->file_id == "a1");
}

TEST_CASE("File id characters", "[share_link]") {
    CHECK(is_file_id_char('a'));
    CHECK(is_file_id_char('Z'));
    CHECK(is_file_id_char('7'));
    CHECK(is_file_id_char('-'));
    CHECK(is_file_id_char('_'));
    CHECK_FALSE(is_file_id_char('/'));
    CHECK_FALSE(is_file_id_char('.'));
    CHECK_FALSE(is_file_id_char('#'));
}
