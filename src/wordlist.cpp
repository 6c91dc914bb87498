#include "../include/wordlist.hpp"

#include "../include/text.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

/**
 * @file wordlist.cpp
 * @brief Implementation of the Wordlist class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        /**
         * @brief Reason a single word cannot appear in a wordlist, or empty.
         */
        std::string wordDefect(const std::string& word) {
            if (word.empty())
                return "is empty";

            for (unsigned char c : word) {
                if (c == '-')
                    return "contains a hyphen";
                if (std::isspace(c))
                    return "contains whitespace";
                if (std::isupper(c))
                    return "is not lowercase";
            }

            return "";
        }
    }

    Wordlist::Wordlist(std::vector<std::string> words) {
        auto violations = validate(words);
        if (!violations.empty()) {
            std::string message = "Invalid wordlist: " + violations.front();
            if (violations.size() > 1)
                message += " (and " + std::to_string(violations.size() - 1) + " more)";
            throw InvalidWordlist(message);
        }

        entries = std::move(words);
        prefixIndex.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i)
            prefixIndex.emplace(prefixOf(entries[i]), i);
    }

    std::vector<std::string> Wordlist::validate(const std::vector<std::string>& words) {
        std::vector<std::string> violations;

        if (words.size() != SIZE) {
            violations.push_back("expected exactly " + std::to_string(SIZE) +
                                 " words, found " + std::to_string(words.size()));
        }

        std::unordered_map<std::string, std::size_t> seen;
        seen.reserve(words.size());

        for (std::size_t i = 0; i < words.size(); ++i) {
            const std::string& word = words[i];

            std::string defect = wordDefect(word);
            if (!defect.empty()) {
                violations.push_back("word #" + std::to_string(i) + " '" + word + "' " + defect);
                continue;
            }

            std::string prefix = prefixOf(word);
            auto inserted = seen.emplace(prefix, i);
            if (!inserted.second) {
                const std::string& other = words[inserted.first->second];
                if (other == word) {
                    violations.push_back("word #" + std::to_string(i) + " '" + word + "' is duplicated");
                } else {
                    violations.push_back("word #" + std::to_string(i) + " '" + word +
                                         "' shares prefix '" + prefix + "' with '" + other + "'");
                }
            }
        }

        return violations;
    }

    std::string Wordlist::prefixOf(const std::string& word) {
        return Text::leadingCodePoints(word, PREFIX_LENGTH);
    }

    std::vector<std::string> Wordlist::readWords(const std::string& path) {
        std::ifstream file(path);
        if (!file)
            throw InvalidWordlist("Unable to open wordlist file: " + path);

        std::vector<std::string> words;
        words.reserve(SIZE);

        std::string line;
        while (std::getline(file, line)) {

            // remove potential '\r'
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            if (!line.empty())
                words.push_back(line);
        }

        return words;
    }

    Wordlist Wordlist::loadFromFile(const std::string& path) {
        auto words = readWords(path);

        try {
            return Wordlist(std::move(words));
        } catch (const InvalidWordlist& e) {
            throw InvalidWordlist(std::string(e.what()) + " in file: " + path);
        }
    }

    void Wordlist::saveToFile(const std::string& path) const {
        std::ofstream file(path, std::ios::trunc);
        if (!file)
            throw InvalidWordlist("Unable to write wordlist file: " + path);

        for (const auto& word : entries)
            file << word << '\n';

        if (!file)
            throw InvalidWordlist("Failed while writing wordlist file: " + path);
    }

    const std::string& Wordlist::at(std::size_t index) const {
        if (index >= entries.size())
            throw std::out_of_range("Word index " + std::to_string(index) + " is out of range");
        return entries[index];
    }

    std::size_t Wordlist::indexOf(const std::string& word) const {
        auto it = prefixIndex.find(prefixOf(word));
        if (it == prefixIndex.end() || entries[it->second] != word)
            return npos;
        return it->second;
    }

    std::size_t Wordlist::indexOfPrefix(const std::string& input) const {
        if (input.empty())
            return npos;

        std::string lowered = Text::toLower(input);
        auto it = prefixIndex.find(prefixOf(lowered));
        if (it == prefixIndex.end())
            return npos;

        const std::string& word = entries[it->second];
        if (word.compare(0, lowered.size(), lowered) != 0)
            return npos;

        return it->second;
    }

    std::string Wordlist::sha256() const {
        std::string text;
        for (const auto& word : entries) {
            text += word;
            text += '\n';
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;

        if (EVP_Digest(text.data(), text.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1)
            throw CryptoException("SHA-256 wordlist fingerprint failed");

        std::ostringstream oss;
        for (unsigned int i = 0; i < digestLen; ++i)
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);

        return oss.str();
    }

}
