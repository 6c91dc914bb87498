#include "../include/candidates.hpp"

#include "../include/prefix_builder.hpp"
#include "../include/text.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

/**
 * @file candidates.cpp
 * @brief Implementation of the CandidateFilter class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        /**
         * @brief Parse a whole string as a base 10 integer.
         * @return false if anything but an optionally signed integer is present.
         */
        bool parseScore(const std::string& text, int& score) {
            std::string trimmed = Text::trim(text);
            if (trimmed.empty())
                return false;

            char* end = nullptr;
            errno = 0;
            long value = std::strtol(trimmed.c_str(), &end, 10);
            if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX)
                return false;

            score = static_cast<int>(value);
            return true;
        }
    }

    FilterReport CandidateFilter::filter(std::istream& input, const FilterOptions& options) {
        FilterReport report;

        std::string line;
        std::size_t lineNumber = 0;

        while (std::getline(input, line)) {
            ++lineNumber;

            std::string trimmed = Text::trim(line);
            if (trimmed.empty())
                continue;

            std::size_t tab = line.find('\t');
            if (tab == std::string::npos || line.find('\t', tab + 1) != std::string::npos) {
                ++report.skippedInvalid;
                report.invalidLines.push_back(lineNumber);
                continue;
            }

            std::string word = PrefixBuilder::normalize(line.substr(0, tab));
            int score = 0;
            if (!parseScore(line.substr(tab + 1), score)) {
                ++report.skippedInvalid;
                report.invalidLines.push_back(lineNumber);
                continue;
            }

            if (score < options.minScore) {
                ++report.skippedLowScore;
                continue;
            }

            if (word.find('-') != std::string::npos) {
                ++report.skippedHyphenated;
                continue;
            }

            if (word.find(' ') != std::string::npos) {
                ++report.skippedSpaces;
                continue;
            }

            std::size_t length = Text::codePoints(word);
            if (length < options.minLength) {
                ++report.skippedTooShort;
                continue;
            }
            if (length > options.maxLength) {
                ++report.skippedTooLong;
                continue;
            }

            report.words.push_back(word);
        }

        std::sort(report.words.begin(), report.words.end());
        report.words.erase(std::unique(report.words.begin(), report.words.end()), report.words.end());

        return report;
    }

    FilterReport CandidateFilter::filterFile(const std::string& path, const FilterOptions& options) {
        std::ifstream file(path);
        if (!file)
            throw InvalidWordlist("Unable to open lexicon file: " + path);

        return filter(file, options);
    }

}
