#include "../include/corpus.hpp"

#include <cmath>
#include <fstream>
#include <unordered_set>

/**
 * @file corpus.cpp
 * @brief Implementation of the Corpus class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        double roundPercent(double value) {
            return std::round(value * 100.0) / 100.0;
        }
    }

    Corpus::Json Corpus::toJson(const ConformanceCorpus& corpus) {
        Json document;
        document["version"] = corpus.version;
        document["description"] = corpus.description;
        document["generated_by"] = corpus.generatedBy;
        if (!corpus.wordlistSha256.empty())
            document["wordlistSha256"] = corpus.wordlistSha256;

        document["constants"] = {
            {"salt", corpus.salt},
            {"iterations", corpus.iterations},
            {"checksumLength", corpus.checksumLength}
        };

        document["statistics"] = {
            {"totalVectors", corpus.statistics.totalVectors},
            {"wordsCovered", corpus.statistics.wordsCovered},
            {"totalWords", corpus.statistics.totalWords},
            {"coveragePercent", corpus.statistics.coveragePercent}
        };

        Json cases = Json::array();
        for (const auto& vector : corpus.testCases) {
            cases.push_back({
                {"address", vector.address},
                {"description", vector.description},
                {"expected", vector.expected}
            });
        }
        document["testCases"] = std::move(cases);

        return document;
    }

    ConformanceCorpus Corpus::fromJson(const Json& document) {
        ConformanceCorpus corpus;

        try {
            corpus.version = document.at("version").get<std::string>();
            corpus.description = document.value("description", std::string());
            corpus.generatedBy = document.value("generated_by", document.value("generatedBy", std::string()));
            corpus.wordlistSha256 = document.value("wordlistSha256", std::string());

            const Json& constants = document.at("constants");
            corpus.salt = constants.at("salt").get<std::string>();
            corpus.iterations = constants.at("iterations").get<unsigned int>();
            corpus.checksumLength = constants.at("checksumLength").get<std::size_t>();

            if (document.contains("statistics")) {
                const Json& stats = document.at("statistics");
                corpus.statistics.totalVectors = stats.at("totalVectors").get<std::size_t>();
                corpus.statistics.wordsCovered = stats.at("wordsCovered").get<std::size_t>();
                corpus.statistics.totalWords = stats.at("totalWords").get<std::size_t>();
                corpus.statistics.coveragePercent = stats.at("coveragePercent").get<double>();
            }

            for (const auto& entry : document.at("testCases")) {
                TestVector vector;
                vector.address = entry.at("address").get<std::string>();
                vector.description = entry.value("description", std::string());
                vector.expected = entry.at("expected").get<std::vector<std::string>>();
                corpus.testCases.push_back(std::move(vector));
            }
        } catch (const nlohmann::json::exception& e) {
            throw CorpusException(std::string("Malformed corpus document: ") + e.what());
        }

        return corpus;
    }

    void Corpus::save(const std::string& path, const ConformanceCorpus& corpus) {
        std::ofstream file(path, std::ios::trunc);
        if (!file)
            throw CorpusException("Unable to write corpus file: " + path);

        file << toJson(corpus).dump(2) << '\n';

        if (!file)
            throw CorpusException("Failed while writing corpus file: " + path);
    }

    ConformanceCorpus Corpus::load(const std::string& path) {
        std::ifstream file(path);
        if (!file)
            throw CorpusException("Unable to open corpus file: " + path);

        Json document;
        try {
            file >> document;
        } catch (const nlohmann::json::exception& e) {
            throw CorpusException("Invalid JSON in corpus file " + path + ": " + e.what());
        }

        return fromJson(document);
    }

    CorpusStatistics Corpus::computeStatistics(const std::vector<TestVector>& vectors, const Wordlist& wordlist) {
        std::unordered_set<std::string> covered;
        for (const auto& vector : vectors) {
            for (const auto& word : vector.expected) {
                if (wordlist.contains(word))
                    covered.insert(word);
            }
        }

        CorpusStatistics stats;
        stats.totalVectors = vectors.size();
        stats.wordsCovered = covered.size();
        stats.totalWords = wordlist.size();
        stats.coveragePercent = roundPercent(100.0 * static_cast<double>(covered.size()) /
                                             static_cast<double>(wordlist.size()));
        return stats;
    }

    std::vector<ReplayMismatch> Corpus::replay(const ConformanceCorpus& corpus, const Wordlist& wordlist) {
        if (corpus.salt != Checksum::SALT || corpus.iterations != Checksum::ITERATIONS)
            throw CorpusException("Corpus uses salt '" + corpus.salt + "' and " +
                                  std::to_string(corpus.iterations) +
                                  " iterations; this implementation derives with '" +
                                  Checksum::SALT + "' and " + std::to_string(Checksum::ITERATIONS));

        if (!corpus.wordlistSha256.empty()) {
            std::string fingerprint = wordlist.sha256();
            if (fingerprint != corpus.wordlistSha256)
                throw CorpusException("Corpus was generated with wordlist " + corpus.wordlistSha256 +
                                      ", replaying with " + fingerprint);
        }

        std::vector<ReplayMismatch> mismatches;

        for (std::size_t i = 0; i < corpus.testCases.size(); ++i) {
            const TestVector& vector = corpus.testCases[i];
            std::vector<std::string> actual;
            try {
                actual = Checksum::derive(vector.address, wordlist, corpus.checksumLength);
            } catch (const CheckphraseException& e) {
                mismatches.push_back({i, vector.address, vector.expected, {}, e.what()});
                continue;
            }

            if (actual != vector.expected)
                mismatches.push_back({i, vector.address, vector.expected, std::move(actual), ""});
        }

        return mismatches;
    }

}
