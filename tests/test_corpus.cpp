/**
 * @file test_corpus.cpp
 * @brief Unit tests for Checkphrase::Corpus using Catch2 and the golden corpus.
 * @author Athos-0day
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/corpus.hpp"

#include <cstdio>
#include <fstream>

using namespace Checkphrase;

namespace {

    const std::string GOLDEN = std::string(CHECKPHRASE_SOURCE_DIR) + "/tests/data/checksums.json";

    const Wordlist& english() {
        static const Wordlist wordlist =
            Wordlist::loadFromFile(std::string(CHECKPHRASE_SOURCE_DIR) + "/wordlists/english.txt");
        return wordlist;
    }

    ConformanceCorpus smallCorpus() {
        ConformanceCorpus corpus;
        corpus.testCases.push_back({"1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", "Bitcoin",
                                    {"alarm", "banana", "secret", "border", "horror"}});
        corpus.testCases.push_back({"1A1zP1eP5QGefi2DMPTfTL5SLmv7DixfNa", "Bitcoin poisoned",
                                    {"join", "flower", "lamp", "busy", "summer"}});
        return corpus;
    }
}

TEST_CASE("Corpus::load reads the golden corpus", "[load]") {
    ConformanceCorpus corpus = Corpus::load(GOLDEN);

    REQUIRE(corpus.version == "1.0");
    REQUIRE(corpus.generatedBy == "checkphrase vectors");
    REQUIRE(corpus.salt == "human-readable-checksum");
    REQUIRE(corpus.iterations == 40000);
    REQUIRE(corpus.checksumLength == 5);
    REQUIRE(corpus.wordlistSha256 == english().sha256());
    REQUIRE(corpus.testCases.size() == 11);
    REQUIRE(corpus.testCases[0].description == "Bitcoin - Satoshi's address");
    REQUIRE(corpus.testCases[10].address == "a");

    REQUIRE(corpus.statistics.totalVectors == 11);
    REQUIRE(corpus.statistics.wordsCovered == 55);
    REQUIRE(corpus.statistics.totalWords == 2048);
    REQUIRE(corpus.statistics.coveragePercent == Approx(2.69));
}

TEST_CASE("Corpus::replay confirms every golden vector", "[replay]") {
    ConformanceCorpus corpus = Corpus::load(GOLDEN);

    REQUIRE(Corpus::replay(corpus, english()).empty());
}

TEST_CASE("Corpus::computeStatistics matches the recorded statistics", "[computeStatistics]") {
    ConformanceCorpus corpus = Corpus::load(GOLDEN);
    CorpusStatistics stats = Corpus::computeStatistics(corpus.testCases, english());

    REQUIRE(stats.totalVectors == corpus.statistics.totalVectors);
    REQUIRE(stats.wordsCovered == corpus.statistics.wordsCovered);
    REQUIRE(stats.totalWords == corpus.statistics.totalWords);
    REQUIRE(stats.coveragePercent == Approx(corpus.statistics.coveragePercent));

    // Repeated words count once
    std::vector<TestVector> twice{corpus.testCases[0], corpus.testCases[0]};
    REQUIRE(Corpus::computeStatistics(twice, english()).wordsCovered == 5);
}

TEST_CASE("Corpus::replay reports vectors that no longer derive", "[replay]") {
    ConformanceCorpus corpus = Corpus::load(GOLDEN);
    corpus.testCases[2].expected[4] = "zoo";

    auto mismatches = Corpus::replay(corpus, english());

    REQUIRE(mismatches.size() == 1);
    REQUIRE(mismatches[0].index == 2);
    REQUIRE(mismatches[0].address == corpus.testCases[2].address);
    REQUIRE(mismatches[0].expected.back() == "zoo");
    REQUIRE(mismatches[0].actual.back() == "eyebrow");
}

TEST_CASE("Corpus::replay keeps going past vectors that cannot be derived", "[replay]") {
    ConformanceCorpus corpus = smallCorpus();
    corpus.testCases.insert(corpus.testCases.begin(), TestVector{"", "empty", {"alarm"}});

    auto mismatches = Corpus::replay(corpus, english());

    REQUIRE(mismatches.size() == 1);
    REQUIRE(mismatches[0].index == 0);
    REQUIRE(mismatches[0].actual.empty());
    REQUIRE_FALSE(mismatches[0].error.empty());

    corpus.testCases.erase(corpus.testCases.begin());
    corpus.checksumLength = 0;
    mismatches = Corpus::replay(corpus, english());

    REQUIRE(mismatches.size() == 2);
    REQUIRE(mismatches[1].index == 1);
    REQUIRE_FALSE(mismatches[1].error.empty());
}

TEST_CASE("Corpus::replay refuses corpora built with other settings", "[replay]") {
    SECTION("salt") {
        ConformanceCorpus corpus = smallCorpus();
        corpus.salt = "another-salt";
        REQUIRE_THROWS_AS(Corpus::replay(corpus, english()), CorpusException);
    }

    SECTION("iterations") {
        ConformanceCorpus corpus = smallCorpus();
        corpus.iterations = 2048;
        REQUIRE_THROWS_AS(Corpus::replay(corpus, english()), CorpusException);
    }

    SECTION("wordlist fingerprint") {
        ConformanceCorpus corpus = smallCorpus();
        corpus.wordlistSha256 = std::string(64, '0');
        REQUIRE_THROWS_AS(Corpus::replay(corpus, english()), CorpusException);

        corpus.wordlistSha256.clear();
        REQUIRE(Corpus::replay(corpus, english()).empty());
    }
}

TEST_CASE("Corpus::toJson keeps the document layout", "[toJson]") {
    ConformanceCorpus corpus = smallCorpus();
    corpus.statistics = Corpus::computeStatistics(corpus.testCases, english());

    Corpus::Json document = Corpus::toJson(corpus);

    REQUIRE(document.begin().key() == "version");
    REQUIRE(document["generated_by"] == "checkphrase vectors");
    REQUIRE_FALSE(document.contains("generatedBy"));
    REQUIRE_FALSE(document.contains("wordlistSha256"));
    REQUIRE(document["constants"]["iterations"] == 40000);
    REQUIRE(document["statistics"]["wordsCovered"] == 10);
    REQUIRE(document["testCases"][1]["expected"][0] == "join");

    ConformanceCorpus decoded = Corpus::fromJson(document);
    REQUIRE(decoded.testCases.size() == 2);
    REQUIRE(decoded.testCases[1].expected == corpus.testCases[1].expected);
    REQUIRE(decoded.statistics.wordsCovered == 10);
}

TEST_CASE("Corpus::fromJson rejects malformed documents", "[fromJson]") {
    Corpus::Json document = Corpus::toJson(smallCorpus());

    SECTION("missing testCases") {
        document.erase("testCases");
        REQUIRE_THROWS_AS(Corpus::fromJson(document), CorpusException);
    }

    SECTION("missing constants") {
        document.erase("constants");
        REQUIRE_THROWS_AS(Corpus::fromJson(document), CorpusException);
    }

    SECTION("wrong type") {
        document["testCases"][0]["expected"] = "alarm-banana-secret-border-horror";
        REQUIRE_THROWS_AS(Corpus::fromJson(document), CorpusException);
    }

    SECTION("camel-case generator key is still read") {
        document.erase("generated_by");
        document["generatedBy"] = "older tool";
        REQUIRE(Corpus::fromJson(document).generatedBy == "older tool");
    }

    SECTION("statistics are optional") {
        document.erase("statistics");
        REQUIRE(Corpus::fromJson(document).testCases.size() == 2);
    }
}

TEST_CASE("Corpus::save and Corpus::load round-trip through a file", "[save][load]") {
    const std::string path = "corpus_tmp.json";
    ConformanceCorpus corpus = smallCorpus();
    corpus.wordlistSha256 = english().sha256();

    Corpus::save(path, corpus);
    ConformanceCorpus loaded = Corpus::load(path);

    REQUIRE(Corpus::toJson(loaded) == Corpus::toJson(corpus));
    std::remove(path.c_str());
}

TEST_CASE("Corpus::load reports unreadable files", "[load]") {
    REQUIRE_THROWS_AS(Corpus::load("does/not/exist.json"), CorpusException);

    const std::string path = "corpus_broken_tmp.json";
    {
        std::ofstream out(path);
        out << "{ \"version\": \"1.0\", ";
    }
    REQUIRE_THROWS_AS(Corpus::load(path), CorpusException);
    std::remove(path.c_str());
}
