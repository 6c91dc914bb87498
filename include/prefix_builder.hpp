#ifndef PREFIX_BUILDER_HPP
#define PREFIX_BUILDER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "wordlist.hpp"

/**
 * @file prefix_builder.hpp
 * @brief Declaration of the builder that grows a wordlist while keeping 4-character prefixes unique.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @brief A word refused (or flagged) because another word already claims its prefix.
     */
    struct PrefixConflict {
        std::string word;
        std::string prefix;
        std::string conflictingWith;
    };

    /**
     * @brief Everything a build run decided, for auditing.
     */
    struct BuildReport {
        std::vector<std::string> finalWords;          // existing + added, sorted
        std::vector<std::string> added;               // in acceptance order
        std::vector<PrefixConflict> rejected;         // candidates refused for their prefix
        std::vector<PrefixConflict> existingConflicts; // collisions already present in the existing list
        std::vector<std::string> skippedHyphenated;
        std::vector<std::string> skippedWhitespace;
        std::vector<std::string> skippedDuplicates;
        std::size_t skippedEmpty = 0;
        std::size_t existingCount = 0;
        std::size_t candidatesProcessed = 0;
        std::size_t maxWords = 0;

        /// @brief True once the final list holds at least maxWords words.
        bool complete() const { return finalWords.size() >= maxWords; }

        std::size_t remainingCapacity() const {
            return complete() ? 0 : maxWords - finalWords.size();
        }
    };

    /**
     * @class PrefixBuilder
     * @brief Adds candidate words to an existing list, in priority order,
     * refusing any word whose prefix is already claimed.
     *
     * Each call builds its own prefix index from its inputs; nothing is kept
     * between calls.
     */
    class PrefixBuilder {
        public:
            static constexpr std::size_t DEFAULT_MAX_WORDS = Wordlist::SIZE;

            /**
             * @brief Trim surrounding whitespace and lowercase a word.
             */
            static std::string normalize(const std::string& word);

            /**
             * @brief Read a word file, one word per line, normalized, blank lines dropped.
             * @throw InvalidWordlist If the file cannot be opened.
             */
            static std::vector<std::string> loadWordFile(const std::string& path);

            /**
             * @brief Write words one per line.
             * @throw InvalidWordlist If the file cannot be written.
             */
            static void saveWordFile(const std::string& path, const std::vector<std::string>& words);

            /**
             * @brief Extend an existing list with candidates.
             *
             * Existing words are always kept, even when they collide with each
             * other (collisions are reported in existingConflicts). Candidates are
             * examined in order; earlier ones win a contested prefix. Once the
             * list reaches maxWords, the remaining candidates are not examined.
             *
             * @param existing Words already accepted.
             * @param candidates Words to try, highest priority first.
             * @param maxWords Size at which the build stops accepting.
             * @return The report; reaching maxWords is a status, never an error.
             */
            static BuildReport build(const std::vector<std::string>& existing,
                                     const std::vector<std::string>& candidates,
                                     std::size_t maxWords = DEFAULT_MAX_WORDS);

            /**
             * @brief Turn a finished build into a validated wordlist.
             * @throw InvalidWordlist If the result is not exactly 2048 words with unique prefixes.
             */
            static Wordlist finalize(const BuildReport& report);
    };

}

#endif
