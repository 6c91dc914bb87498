#include "../include/prefix_builder.hpp"

#include "../include/text.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <unordered_map>

/**
 * @file prefix_builder.cpp
 * @brief Implementation of the PrefixBuilder class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        bool hasWhitespace(const std::string& word) {
            return std::any_of(word.begin(), word.end(),
                               [](unsigned char c) { return std::isspace(c) != 0; });
        }
    }

    std::string PrefixBuilder::normalize(const std::string& word) {
        return Text::toLower(Text::trim(word));
    }

    std::vector<std::string> PrefixBuilder::loadWordFile(const std::string& path) {
        std::ifstream file(path);
        if (!file)
            throw InvalidWordlist("Unable to open word file: " + path);

        std::vector<std::string> words;
        std::string line;
        while (std::getline(file, line)) {
            std::string word = normalize(line);
            if (!word.empty())
                words.push_back(word);
        }

        return words;
    }

    void PrefixBuilder::saveWordFile(const std::string& path, const std::vector<std::string>& words) {
        std::ofstream file(path, std::ios::trunc);
        if (!file)
            throw InvalidWordlist("Unable to write word file: " + path);

        for (const auto& word : words)
            file << word << '\n';

        if (!file)
            throw InvalidWordlist("Failed while writing word file: " + path);
    }

    BuildReport PrefixBuilder::build(const std::vector<std::string>& existing,
                                     const std::vector<std::string>& candidates,
                                     std::size_t maxWords) {
        BuildReport report;
        report.maxWords = maxWords;

        std::set<std::string> accepted;
        std::unordered_map<std::string, std::string> prefixIndex;

        // Existing words are trusted: a collision among them is only flagged.
        for (const auto& raw : existing) {
            std::string word = normalize(raw);
            if (word.empty() || !accepted.insert(word).second)
                continue;

            std::string prefix = Wordlist::prefixOf(word);
            auto claimed = prefixIndex.emplace(prefix, word);
            if (!claimed.second)
                report.existingConflicts.push_back({word, prefix, claimed.first->second});
        }

        report.existingCount = accepted.size();
        std::size_t total = accepted.size();

        for (const auto& raw : candidates) {
            if (total >= maxWords)
                break;

            ++report.candidatesProcessed;

            std::string candidate = normalize(raw);

            if (candidate.empty()) {
                ++report.skippedEmpty;
                continue;
            }

            if (candidate.find('-') != std::string::npos) {
                report.skippedHyphenated.push_back(candidate);
                continue;
            }

            if (hasWhitespace(candidate)) {
                report.skippedWhitespace.push_back(candidate);
                continue;
            }

            if (accepted.count(candidate) != 0) {
                report.skippedDuplicates.push_back(candidate);
                continue;
            }

            std::string prefix = Wordlist::prefixOf(candidate);
            auto claimed = prefixIndex.find(prefix);
            if (claimed != prefixIndex.end()) {
                report.rejected.push_back({candidate, prefix, claimed->second});
                continue;
            }

            prefixIndex.emplace(prefix, candidate);
            accepted.insert(candidate);
            report.added.push_back(candidate);
            ++total;
        }

        report.finalWords.assign(accepted.begin(), accepted.end());

        return report;
    }

    Wordlist PrefixBuilder::finalize(const BuildReport& report) {
        return Wordlist(report.finalWords);
    }

}
