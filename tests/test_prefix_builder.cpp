/**
 * @file test_prefix_builder.cpp
 * @brief Unit tests for Checkphrase::PrefixBuilder using Catch2.
 * @author Athos-0day
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/prefix_builder.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <set>

using namespace Checkphrase;

namespace {

    const std::string ENGLISH = std::string(CHECKPHRASE_SOURCE_DIR) + "/wordlists/english.txt";

    bool containsAll(const std::vector<std::string>& haystack, const std::vector<std::string>& needles) {
        std::set<std::string> set(haystack.begin(), haystack.end());
        return std::all_of(needles.begin(), needles.end(),
                           [&](const std::string& w) { return set.count(w) != 0; });
    }

    bool prefixesUnique(const std::vector<std::string>& words) {
        std::set<std::string> prefixes;
        for (const auto& word : words) {
            if (!prefixes.insert(Wordlist::prefixOf(word)).second)
                return false;
        }
        return true;
    }
}

TEST_CASE("PrefixBuilder::build rejects a candidate sharing an existing prefix", "[build]") {
    BuildReport report = PrefixBuilder::build({"apple"}, {"apply"}, 10);

    REQUIRE(report.finalWords == std::vector<std::string>{"apple"});
    REQUIRE(report.added.empty());
    REQUIRE(report.rejected.size() == 1);
    REQUIRE(report.rejected[0].word == "apply");
    REQUIRE(report.rejected[0].prefix == "appl");
    REQUIRE(report.rejected[0].conflictingWith == "apple");
}

TEST_CASE("PrefixBuilder::build gives contested prefixes to earlier candidates", "[build]") {
    BuildReport report = PrefixBuilder::build({}, {"banner", "banana", "cherry", "chert"}, 10);

    REQUIRE(report.added == std::vector<std::string>{"banner", "cherry"});
    REQUIRE(report.rejected.size() == 2);
    REQUIRE(report.rejected[0].word == "banana");
    REQUIRE(report.rejected[0].conflictingWith == "banner");
    REQUIRE(report.rejected[1].word == "chert");
    REQUIRE(report.rejected[1].conflictingWith == "cherry");
}

TEST_CASE("PrefixBuilder::build normalizes and filters candidates", "[build][normalize]") {
    REQUIRE(PrefixBuilder::normalize("  Apple\t") == "apple");
    REQUIRE(PrefixBuilder::normalize("   ") == "");

    BuildReport report = PrefixBuilder::build(
        {" Zebra "},
        {"WELL-BEING", "ice cream", "zebra", "   ", "Orange", "orange"},
        10);

    REQUIRE(report.finalWords == std::vector<std::string>{"orange", "zebra"});
    REQUIRE(report.added == std::vector<std::string>{"orange"});
    REQUIRE(report.skippedHyphenated == std::vector<std::string>{"well-being"});
    REQUIRE(report.skippedWhitespace == std::vector<std::string>{"ice cream"});
    REQUIRE(report.skippedDuplicates == std::vector<std::string>{"zebra", "orange"});
    REQUIRE(report.skippedEmpty == 1);
    REQUIRE(report.rejected.empty());
}

TEST_CASE("PrefixBuilder::build keeps colliding existing words and flags them", "[build]") {
    BuildReport report = PrefixBuilder::build({"apple", "apply", "apple"}, {"applause", "berry"}, 10);

    REQUIRE(report.existingCount == 2);
    REQUIRE(report.existingConflicts.size() == 1);
    REQUIRE(report.existingConflicts[0].word == "apply");
    REQUIRE(report.existingConflicts[0].conflictingWith == "apple");

    REQUIRE(containsAll(report.finalWords, {"apple", "apply"}));
    REQUIRE(report.added == std::vector<std::string>{"berry"});
    REQUIRE(report.rejected.size() == 1);
    REQUIRE(report.rejected[0].word == "applause");
}

TEST_CASE("PrefixBuilder::build stops examining candidates at the cap", "[build]") {
    BuildReport report = PrefixBuilder::build({"apple"}, {"berry", "cherry", "apply", "date", "elder"}, 3);

    REQUIRE(report.finalWords == std::vector<std::string>{"apple", "berry", "cherry"});
    REQUIRE(report.candidatesProcessed == 2);
    REQUIRE(report.rejected.empty());
    REQUIRE(report.complete());
    REQUIRE(report.remainingCapacity() == 0);
    REQUIRE(report.finalWords.size() <= report.maxWords);
}

TEST_CASE("PrefixBuilder::build reports a shortfall as a status", "[build]") {
    BuildReport report = PrefixBuilder::build({"apple"}, {"apply", "berry"}, 5);

    REQUIRE_FALSE(report.complete());
    REQUIRE(report.remainingCapacity() == 3);
    REQUIRE(report.candidatesProcessed == 2);
}

TEST_CASE("PrefixBuilder::build never drops existing words", "[build]") {
    std::vector<std::string> existing{"delta", "alpha", "charlie", "bravo"};

    BuildReport report = PrefixBuilder::build(existing, {"alphabet", "echo"}, 3);

    // Already above the cap: nothing is added and nothing is removed
    REQUIRE(report.finalWords == std::vector<std::string>{"alpha", "bravo", "charlie", "delta"});
    REQUIRE(report.added.empty());
    REQUIRE(report.candidatesProcessed == 0);
}

TEST_CASE("PrefixBuilder::build checks candidates against words accepted in the same run", "[build]") {
    std::vector<std::string> candidates{"stone", "storm", "stove", "stork", "story", "stool"};

    BuildReport first = PrefixBuilder::build({}, candidates, 100);
    REQUIRE(prefixesUnique(first.finalWords));
    REQUIRE(first.added == std::vector<std::string>{"stone", "storm", "stove", "stool"});
    REQUIRE(first.rejected.size() == 2);

    // A second call starts from its own inputs only
    BuildReport second = PrefixBuilder::build({}, candidates, 100);
    REQUIRE(second.added == first.added);
}

TEST_CASE("PrefixBuilder::build compares prefixes by character, not byte", "[build][utf8]") {
    // "naïve" and "naïf" share their first four bytes but not their first four characters
    BuildReport report = PrefixBuilder::build({"na\xC3\xAFve"}, {"na\xC3\xAF" "f", "na\xC3\xAFvet\xC3\xA9"}, 10);

    REQUIRE(report.added == std::vector<std::string>{"na\xC3\xAF" "f"});
    REQUIRE(report.rejected.size() == 1);
    REQUIRE(report.rejected[0].word == "na\xC3\xAFvet\xC3\xA9");
    REQUIRE(report.rejected[0].prefix == "na\xC3\xAFv");
    REQUIRE(report.rejected[0].conflictingWith == "na\xC3\xAFve");
}

TEST_CASE("PrefixBuilder::finalize rebuilds the reference list", "[finalize]") {
    auto english = Wordlist::readWords(ENGLISH);

    std::vector<std::string> existing(english.begin() + 10, english.end());
    std::vector<std::string> candidates(english.begin(), english.begin() + 10);
    candidates.insert(candidates.begin() + 1, "abandoned");

    BuildReport report = PrefixBuilder::build(existing, candidates, Wordlist::SIZE);

    REQUIRE(report.complete());
    REQUIRE(report.added.size() == 10);
    REQUIRE(report.rejected.size() == 1);
    REQUIRE(report.rejected[0].word == "abandoned");
    REQUIRE(report.rejected[0].conflictingWith == "abandon");

    Wordlist wordlist = PrefixBuilder::finalize(report);
    REQUIRE(wordlist.sha256() == "2f5eed53a4727b4bf8880d8f3f199efc90e58503646d9ff8eff3a2ed3b24dbda");
}

TEST_CASE("PrefixBuilder::finalize refuses incomplete or colliding lists", "[finalize]") {
    REQUIRE_THROWS_AS(PrefixBuilder::finalize(PrefixBuilder::build({"apple"}, {}, 2048)), InvalidWordlist);

    auto english = Wordlist::readWords(ENGLISH);
    english.back() = "abandoned";
    BuildReport report = PrefixBuilder::build(english, {}, Wordlist::SIZE);
    REQUIRE(report.existingConflicts.size() == 1);
    REQUIRE_THROWS_AS(PrefixBuilder::finalize(report), InvalidWordlist);
}

TEST_CASE("PrefixBuilder::loadWordFile normalizes and drops blank lines", "[loadWordFile]") {
    const std::string path = "builder_words_tmp.txt";
    {
        std::ofstream out(path);
        out << "  Apple\n\nBERRY \r\n\t\ncherry\n";
    }

    REQUIRE(PrefixBuilder::loadWordFile(path) == std::vector<std::string>{"apple", "berry", "cherry"});
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(PrefixBuilder::loadWordFile("does/not/exist.txt"), InvalidWordlist);
}
