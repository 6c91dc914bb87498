#ifndef VECTOR_GENERATOR_HPP
#define VECTOR_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "checksum.hpp"
#include "corpus.hpp"
#include "wordlist.hpp"

/**
 * @file vector_generator.hpp
 * @brief Declaration of the generator producing the conformance corpus.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @brief Hand-picked address that always opens the corpus.
     */
    struct CanonicalCase {
        std::string address;
        std::string description;
    };

    struct GeneratorOptions {
        std::size_t targetCount = 1000;
        bool ensureFullCoverage = true;
        uint32_t seed = 42;
        std::size_t attemptsPerTarget = 1000; // attempt budget = targetCount * attemptsPerTarget
        std::size_t checksumLength = Checksum::DEFAULT_LENGTH;
        unsigned int threads = 1;
    };

    enum class GenerationStatus {
        Complete,
        CoverageIncomplete
    };

    struct GenerationResult {
        ConformanceCorpus corpus;
        GenerationStatus status = GenerationStatus::Complete;
        std::size_t attempts = 0;
        std::vector<std::string> missingWords; // in wordlist order
    };

    /**
     * @class VectorGenerator
     * @brief Builds a reproducible corpus of address/checkphrase pairs.
     *
     * Canonical cases come first, in order. Pseudo-addresses drawn from a
     * seeded generator follow, kept while the corpus is below targetCount or,
     * with ensureFullCoverage, while they bring a word not seen yet. The run
     * stops when both goals are met or the attempt budget is spent; the same
     * options always give the same corpus, whatever the thread count.
     */
    class VectorGenerator {
        public:
            /// @brief Upper bound on worker threads when the hardware count is unknown or larger.
            static constexpr unsigned int MAX_THREADS = 64;

            /**
             * @brief Number of derivation threads actually used for a request.
             * @return `requested` clamped to [1, hardware concurrency] and to MAX_THREADS.
             */
            static unsigned int effectiveThreads(unsigned int requested);

            /// @brief Chain-style prefixes used for synthesized addresses ("" = none).
            static const std::vector<std::string>& addressPrefixes();

            /// @brief Real-world addresses plus a one-character "poisoned" variant.
            static const std::vector<CanonicalCase>& defaultCanonicalCases();

            /**
             * @brief Generate a corpus.
             * @param wordlist Wordlist to derive with (never modified).
             * @param options Target size, coverage goal, seed, budget and threads.
             * @param canonicalCases Inputs always included first.
             * @return Corpus, status and the words never reached.
             * @throw InvalidAddress If a canonical address is empty.
             * @throw ForbiddenSize If options.checksumLength is out of range.
             * @throw CheckphraseException If a worker thread cannot be started.
             */
            static GenerationResult generate(const Wordlist& wordlist,
                                             const GeneratorOptions& options,
                                             const std::vector<CanonicalCase>& canonicalCases);

            static GenerationResult generate(const Wordlist& wordlist,
                                             const GeneratorOptions& options = GeneratorOptions());
    };

}

#endif
