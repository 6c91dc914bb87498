#include "../include/vector_generator.hpp"

#include <algorithm>
#include <exception>
#include <random>
#include <system_error>
#include <thread>
#include <unordered_set>

/**
 * @file vector_generator.cpp
 * @brief Implementation of the VectorGenerator class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        const std::string ALPHANUMERIC =
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

        constexpr std::size_t MIN_ADDRESS_LENGTH = 30;
        constexpr std::size_t MAX_ADDRESS_LENGTH = 64;

        // Addresses handed to the workers per synchronization point, per thread.
        constexpr std::size_t ADDRESSES_PER_THREAD = 8;

        /**
         * @brief Seeded source of address-like strings.
         */
        class AddressSource {
            public:
                explicit AddressSource(uint32_t seed) : rng(seed) {}

                std::string next() {
                    const auto& prefixes = VectorGenerator::addressPrefixes();
                    std::uniform_int_distribution<std::size_t> pickPrefix(0, prefixes.size() - 1);
                    std::uniform_int_distribution<std::size_t> pickLength(MIN_ADDRESS_LENGTH, MAX_ADDRESS_LENGTH);
                    std::uniform_int_distribution<std::size_t> pickChar(0, ALPHANUMERIC.size() - 1);

                    std::string address = prefixes[pickPrefix(rng)];
                    std::size_t length = pickLength(rng);
                    while (address.size() < length)
                        address += ALPHANUMERIC[pickChar(rng)];

                    return address;
                }

            private:
                std::mt19937 rng;
        };

        /**
         * @brief Derive the phrases of a batch, each worker writing only its own slots.
         */
        std::vector<std::vector<std::string>> deriveBatch(const std::vector<std::string>& addresses,
                                                          const Wordlist& wordlist,
                                                          std::size_t length,
                                                          unsigned int threads) {
            std::vector<std::vector<std::string>> phrases(addresses.size());

            std::size_t workers = std::min<std::size_t>(threads, addresses.size());
            if (workers <= 1) {
                for (std::size_t k = 0; k < addresses.size(); ++k)
                    phrases[k] = Checksum::derive(addresses[k], wordlist, length);
                return phrases;
            }

            std::vector<std::exception_ptr> errors(workers);
            std::vector<std::thread> pool;
            pool.reserve(workers);

            try {
                for (std::size_t t = 0; t < workers; ++t) {
                    pool.emplace_back([&, t]() {
                        try {
                            for (std::size_t k = t; k < addresses.size(); k += workers)
                                phrases[k] = Checksum::derive(addresses[k], wordlist, length);
                        } catch (...) {
                            errors[t] = std::current_exception();
                        }
                    });
                }
            } catch (const std::system_error& e) {
                // Workers already running still touch `phrases`: wait for them.
                for (auto& worker : pool)
                    worker.join();
                throw CheckphraseException(std::string("Unable to start derivation thread: ") + e.what());
            }

            for (auto& worker : pool)
                worker.join();

            for (const auto& error : errors) {
                if (error)
                    std::rethrow_exception(error);
            }

            return phrases;
        }
    }

    unsigned int VectorGenerator::effectiveThreads(unsigned int requested) {
        unsigned int limit = std::thread::hardware_concurrency();
        if (limit == 0 || limit > MAX_THREADS)
            limit = MAX_THREADS;

        return std::max(1u, std::min(requested, limit));
    }

    const std::vector<std::string>& VectorGenerator::addressPrefixes() {
        static const std::vector<std::string> prefixes = {
            "0x",       // Ethereum-style
            "1",        // Bitcoin legacy
            "3",        // Bitcoin P2SH
            "bc1q",     // Bitcoin bech32
            "cosmos1",
            "osmo1",
            "5",        // Polkadot
            "qzk",      // Quantus
            ""
        };
        return prefixes;
    }

    const std::vector<CanonicalCase>& VectorGenerator::defaultCanonicalCases() {
        static const std::vector<CanonicalCase> cases = {
            {"1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", "Bitcoin - Satoshi's address"},
            {"1A1zP1eP5QGefi2DMPTfTL5SLmv7DixfNa", "Bitcoin - poisoned variant"},
            {"0x742d35Cc6634C0532925a3b844Bc9e7595f5bE21", "Ethereum"},
            {"5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQY", "Polkadot"},
            {"cosmos1hsk6jryyqjfhp5dhc55tc9jtckygx0eph6dd02", "Cosmos"},
            {"bc1qar0srrr7xfkvy5l643lydnw9re59gtzzwf5mdq", "Bitcoin bech32"},
            {"qzk7h3xH4Fmv2RqKpN8sT5jW9cY6gB1dL3mX0vQwEaUoZrJtS", "Quantus 1"},
            {"qzkABCDEF123456789abcdefGHIJKLMNOPQRSTUVWXYZ000001", "Quantus 2"},
            {"qzkXyZ987654321FeDcBaAbCdEfGhIjKlMnOpQrStUvWxYz99", "Quantus 3"}
        };
        return cases;
    }

    GenerationResult VectorGenerator::generate(const Wordlist& wordlist, const GeneratorOptions& options) {
        return generate(wordlist, options, defaultCanonicalCases());
    }

    GenerationResult VectorGenerator::generate(const Wordlist& wordlist,
                                               const GeneratorOptions& options,
                                               const std::vector<CanonicalCase>& canonicalCases) {
        // Reject a bad length before spending any PBKDF2 work.
        Checksum::keyLength(options.checksumLength);

        GenerationResult result;
        ConformanceCorpus& corpus = result.corpus;
        corpus.checksumLength = options.checksumLength;
        corpus.wordlistSha256 = wordlist.sha256();

        std::vector<TestVector>& vectors = corpus.testCases;
        std::unordered_set<std::string> covered;

        for (const auto& canonical : canonicalCases) {
            auto phrase = Checksum::derive(canonical.address, wordlist, options.checksumLength);
            covered.insert(phrase.begin(), phrase.end());
            vectors.push_back({canonical.address, canonical.description, std::move(phrase)});
        }

        auto finished = [&]() {
            return vectors.size() >= options.targetCount &&
                   (!options.ensureFullCoverage || covered.size() == wordlist.size());
        };

        const std::size_t maxAttempts = options.targetCount * options.attemptsPerTarget;
        const unsigned int threads = effectiveThreads(options.threads);
        const std::size_t batchSize = threads > 1 ? threads * ADDRESSES_PER_THREAD : 1;

        AddressSource source(options.seed);

        while (!finished() && result.attempts < maxAttempts) {
            std::size_t count = std::min(batchSize, maxAttempts - result.attempts);

            std::vector<std::string> addresses;
            addresses.reserve(count);
            for (std::size_t k = 0; k < count; ++k)
                addresses.push_back(source.next());

            auto phrases = deriveBatch(addresses, wordlist, options.checksumLength, threads);

            // Acceptance is decided in address order so the corpus does not depend on threads.
            for (std::size_t k = 0; k < count && !finished(); ++k) {
                ++result.attempts;

                const auto& phrase = phrases[k];
                bool bringsNewWord = std::any_of(phrase.begin(), phrase.end(),
                    [&](const std::string& word) { return covered.count(word) == 0; });

                bool needMoreVectors = vectors.size() < options.targetCount;
                bool needMoreCoverage = options.ensureFullCoverage && bringsNewWord;

                if (needMoreVectors || needMoreCoverage) {
                    covered.insert(phrase.begin(), phrase.end());
                    vectors.push_back({addresses[k],
                                       "Generated test vector #" + std::to_string(vectors.size() + 1),
                                       phrase});
                }
            }
        }

        corpus.statistics = Corpus::computeStatistics(vectors, wordlist);

        for (const auto& word : wordlist.words()) {
            if (covered.count(word) == 0)
                result.missingWords.push_back(word);
        }

        result.status = finished() ? GenerationStatus::Complete : GenerationStatus::CoverageIncomplete;

        return result;
    }

}
