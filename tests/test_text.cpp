/**
 * @file test_text.cpp
 * @brief Unit tests for Checkphrase::Text using Catch2.
 * @author Athos-0day
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/text.hpp"

using namespace Checkphrase;

TEST_CASE("Text::trim removes surrounding whitespace only", "[trim]") {
    REQUIRE(Text::trim("  alarm\t\r\n") == "alarm");
    REQUIRE(Text::trim("ice cream") == "ice cream");
    REQUIRE(Text::trim(" \t ").empty());
    REQUIRE(Text::trim("").empty());
}

TEST_CASE("Text::toLower lowercases ASCII and keeps other bytes", "[toLower]") {
    REQUIRE(Text::toLower("ALARM Banana") == "alarm banana");
    REQUIRE(Text::toLower("CAF\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("Text::codePoints counts characters, not bytes", "[codePoints]") {
    REQUIRE(Text::codePoints("alarm") == 5);
    REQUIRE(Text::codePoints("caf\xC3\xA9") == 4);
    REQUIRE(Text::codePoints("\xE2\x82\xAC") == 1);
    REQUIRE(Text::codePoints("") == 0);
}

TEST_CASE("Text::leadingCodePoints never splits a character", "[leadingCodePoints]") {
    REQUIRE(Text::leadingCodePoints("alarm", 4) == "alar");
    REQUIRE(Text::leadingCodePoints("zoo", 4) == "zoo");
    REQUIRE(Text::leadingCodePoints("na\xC3\xAFve", 4) == "na\xC3\xAFv");
    REQUIRE(Text::leadingCodePoints("na\xC3\xAF" "f", 4) == "na\xC3\xAF" "f");
    REQUIRE(Text::leadingCodePoints("caf\xC3\xA9", 3) == "caf");
    REQUIRE(Text::leadingCodePoints("\xE2\x82\xAC" "uro", 1) == "\xE2\x82\xAC");
    REQUIRE(Text::leadingCodePoints("alarm", 0).empty());
}
