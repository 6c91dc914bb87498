#ifndef WORDLIST_HPP
#define WORDLIST_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "exceptions.hpp"

/**
 * @file wordlist.hpp
 * @brief Declaration of the immutable 2048-word vocabulary used by checkphrases.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @class Wordlist
     * @brief Ordered, validated list of exactly 2048 words.
     *
     * A word's index (0..2047) is its identity. Every word is uniquely
     * identified by its first PREFIX_LENGTH characters, and no word contains
     * a hyphen or whitespace, so phrases can be joined with a fixed separator.
     * Instances never change after construction.
     */
    class Wordlist {
        public:
            /// @brief Exact number of words (2^11).
            static constexpr std::size_t SIZE = 2048;

            /// @brief Number of leading characters that identify a word.
            static constexpr std::size_t PREFIX_LENGTH = 4;

            /// @brief Returned by lookups that find nothing.
            static constexpr std::size_t npos = static_cast<std::size_t>(-1);

            /**
             * @brief Build a wordlist, enforcing every invariant.
             * @param words Words in canonical order.
             * @throw InvalidWordlist If validate() reports any violation.
             */
            explicit Wordlist(std::vector<std::string> words);

            /**
             * @brief Collect every invariant violation of a candidate list.
             *
             * Checks the exact size, that each word is non-empty, lowercase and
             * free of hyphens and whitespace, and that no two words share a prefix.
             *
             * @param words Words to check.
             * @return Human readable violations, empty if the list is valid.
             */
            static std::vector<std::string> validate(const std::vector<std::string>& words);

            /**
             * @brief First PREFIX_LENGTH characters of a word (the whole word if shorter).
             *
             * Characters are UTF-8 code points, so a multi-byte character is never split.
             */
            static std::string prefixOf(const std::string& word);

            /**
             * @brief Read the words of a newline-delimited file without validating them.
             *
             * Trailing carriage returns are removed and blank lines ignored.
             *
             * @throw InvalidWordlist If the file cannot be opened.
             */
            static std::vector<std::string> readWords(const std::string& path);

            /**
             * @brief Load a newline-delimited wordlist file.
             *
             * @param path Path of the file.
             * @return The validated wordlist.
             * @throw InvalidWordlist If the file cannot be opened or is invalid.
             */
            static Wordlist loadFromFile(const std::string& path);

            /**
             * @brief Write the words, one per line, in canonical order.
             * @throw InvalidWordlist If the file cannot be written.
             */
            void saveToFile(const std::string& path) const;

            /**
             * @brief Word at a given index.
             * @throw std::out_of_range If index >= SIZE.
             */
            const std::string& at(std::size_t index) const;

            const std::string& operator[](std::size_t index) const { return entries[index]; }

            std::size_t size() const { return entries.size(); }

            const std::vector<std::string>& words() const { return entries; }

            bool contains(const std::string& word) const { return indexOf(word) != npos; }

            /**
             * @brief Index of an exact word, or npos.
             */
            std::size_t indexOf(const std::string& word) const;

            /**
             * @brief Resolve a word from an abbreviation of it.
             *
             * Accepts the full word or any input whose prefix identifies a word
             * and which the word starts with ("alar" resolves to "alarm").
             * Matching is case-insensitive.
             *
             * @return Index of the word, or npos.
             */
            std::size_t indexOfPrefix(const std::string& input) const;

            /**
             * @brief SHA-256 fingerprint of the canonical file contents, as lowercase hex.
             *
             * A checkphrase is only meaningful relative to the exact wordlist
             * that produced it; this fingerprint names that version.
             *
             * @throw CryptoException If hashing fails.
             */
            std::string sha256() const;

        private:
            std::vector<std::string> entries;
            std::unordered_map<std::string, std::size_t> prefixIndex;
    };

}

#endif
