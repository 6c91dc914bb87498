#ifndef CANDIDATES_HPP
#define CANDIDATES_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "exceptions.hpp"

/**
 * @file candidates.hpp
 * @brief Preparation of candidate words from a scored (word<TAB>score) lexicon.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    struct FilterOptions {
        int minScore = 1;
        std::size_t minLength = 3;
        std::size_t maxLength = 8;
    };

    struct FilterReport {
        std::vector<std::string> words; // kept words, deduplicated and sorted
        std::size_t skippedLowScore = 0;
        std::size_t skippedHyphenated = 0;
        std::size_t skippedSpaces = 0;
        std::size_t skippedTooShort = 0;
        std::size_t skippedTooLong = 0;
        std::size_t skippedInvalid = 0;
        std::vector<std::size_t> invalidLines; // 1-based line numbers
    };

    /**
     * @class CandidateFilter
     * @brief Selects candidate words for PrefixBuilder from a sentiment lexicon.
     *
     * Each non-blank line must be "word<TAB>score". Words are lowercased; a word
     * is kept when its score reaches minScore, it has no hyphen or space and its
     * length (in UTF-8 code points) lies within [minLength, maxLength].
     */
    class CandidateFilter {
        public:
            static FilterReport filter(std::istream& input, const FilterOptions& options = FilterOptions());

            /**
             * @throw InvalidWordlist If the file cannot be opened.
             */
            static FilterReport filterFile(const std::string& path, const FilterOptions& options = FilterOptions());
    };

}

#endif
