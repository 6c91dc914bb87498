#ifndef CORPUS_HPP
#define CORPUS_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "checksum.hpp"
#include "exceptions.hpp"
#include "wordlist.hpp"

/**
 * @file corpus.hpp
 * @brief Conformance corpus: golden address/checkphrase pairs shared by every implementation.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    struct TestVector {
        std::string address;
        std::string description;
        std::vector<std::string> expected;
    };

    struct CorpusStatistics {
        std::size_t totalVectors = 0;
        std::size_t wordsCovered = 0;
        std::size_t totalWords = 0;
        double coveragePercent = 0.0; // rounded to 2 decimals
    };

    /**
     * @brief A corpus document and the constants it was produced with.
     */
    struct ConformanceCorpus {
        std::string version = "1.0";
        std::string description = "Cross-platform test vectors for human-checkphrase";
        std::string generatedBy = "checkphrase vectors";
        std::string salt = Checksum::SALT;
        unsigned int iterations = Checksum::ITERATIONS;
        std::size_t checksumLength = Checksum::DEFAULT_LENGTH;
        std::string wordlistSha256; // empty when unknown
        CorpusStatistics statistics;
        std::vector<TestVector> testCases;
    };

    /**
     * @brief A vector whose re-derived phrase differs from the recorded one,
     * or which could not be derived at all.
     */
    struct ReplayMismatch {
        std::size_t index;
        std::string address;
        std::vector<std::string> expected;
        std::vector<std::string> actual; // empty when derivation failed
        std::string error;               // why derivation failed, empty otherwise
    };

    /**
     * @class Corpus
     * @brief JSON codec, statistics and replay for conformance corpora.
     *
     * Document layout (keys kept in this order):
     * {
     *   "version", "description", "generated_by", "wordlistSha256" (optional),
     *   "constants":  { "salt", "iterations", "checksumLength" },
     *   "statistics": { "totalVectors", "wordsCovered", "totalWords", "coveragePercent" },
     *   "testCases":  [ { "address", "description", "expected": [...] }, ... ]
     * }
     */
    class Corpus {
        public:
            using Json = nlohmann::ordered_json;

            static Json toJson(const ConformanceCorpus& corpus);

            /**
             * @throw CorpusException If a required field is missing or has the wrong type.
             */
            static ConformanceCorpus fromJson(const Json& document);

            /**
             * @throw CorpusException If the file cannot be written.
             */
            static void save(const std::string& path, const ConformanceCorpus& corpus);

            /**
             * @throw CorpusException If the file cannot be read or parsed.
             */
            static ConformanceCorpus load(const std::string& path);

            /**
             * @brief Count the distinct wordlist words appearing in the vectors.
             */
            static CorpusStatistics computeStatistics(const std::vector<TestVector>& vectors, const Wordlist& wordlist);

            /**
             * @brief Re-derive every vector and report the ones that differ.
             *
             * @param corpus Corpus to check.
             * @param wordlist Wordlist the corpus claims to be built on.
             * A vector that cannot be derived (empty address, bad length) is
             * reported as a mismatch carrying the error; the replay goes on.
             *
             * @return Mismatches in corpus order; empty means the implementation conforms.
             * @throw CorpusException If the corpus uses other derivation constants
             * or names another wordlist fingerprint.
             */
            static std::vector<ReplayMismatch> replay(const ConformanceCorpus& corpus, const Wordlist& wordlist);
    };

}

#endif
