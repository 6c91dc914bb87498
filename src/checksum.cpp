#include "../include/checksum.hpp"

#include "../include/text.hpp"

#include <openssl/evp.h>

#include <cstring>
#include <sstream>

/**
 * @file checksum.cpp
 * @brief Implementation of the Checksum class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        /**
         * @brief Check the number of words requested.
         * @param length Number of words.
         * @throw ForbiddenSize If the length is 0 or above MAX_LENGTH.
         */
        inline void checkLength(std::size_t length) {
            if (length == 0 || length > Checksum::MAX_LENGTH) {
                throw ForbiddenSize("Checksum length must be between 1 and " +
                                    std::to_string(Checksum::MAX_LENGTH) + " words.");
            }
        }

        /**
         * @brief Read `width` bits starting at a bit offset counted from the
         * most significant bit of a big-endian buffer.
         *
         * @param buffer Big-endian bytes.
         * @param offset Offset of the first bit (0 = MSB of buffer[0]).
         * @param width Number of bits, at most 24.
         */
        uint32_t readBits(const std::vector<uint8_t>& buffer, std::size_t offset, std::size_t width) {
            std::size_t first = offset / 8;
            std::size_t last = (offset + width - 1) / 8;

            uint32_t window = 0;
            for (std::size_t b = first; b <= last; ++b)
                window = (window << 8) | buffer[b];

            std::size_t trailing = (last + 1) * 8 - (offset + width);

            return (window >> trailing) & ((1u << width) - 1);
        }
    }

    std::size_t Checksum::keyLength(std::size_t length) {
        checkLength(length);

        return (length * BITS_PER_WORD + 7) / 8;
    }

    std::size_t Checksum::alignmentShift(std::size_t length) {
        return (8 * keyLength(length)) % BITS_PER_WORD;
    }

    std::vector<uint8_t> Checksum::deriveKey(const std::string& address, std::size_t length) {
        if (address.empty())
            throw InvalidAddress("Address must not be empty.");

        std::vector<uint8_t> key(keyLength(length));

        if (PKCS5_PBKDF2_HMAC(
                address.data(),
                static_cast<int>(address.size()),
                reinterpret_cast<const unsigned char*>(SALT),
                static_cast<int>(std::strlen(SALT)),
                static_cast<int>(ITERATIONS),
                EVP_sha256(),
                static_cast<int>(key.size()),
                key.data()
            ) != 1)
        {
            throw CryptoException("PBKDF2-HMAC-SHA256 derivation failed");
        }

        return key;
    }

    std::vector<uint16_t> Checksum::extractIndices(const std::vector<uint8_t>& key, std::size_t length) {
        if (key.size() != keyLength(length))
            throw ForbiddenSize("A " + std::to_string(key.size()) + "-byte key cannot feed " +
                                std::to_string(length) + " words.");

        // After the right shift, the remaining bits are the top (8 * size - shift)
        // bits of the key; the words are the last `length` 11-bit groups of them.
        std::size_t usableBits = key.size() * 8 - alignmentShift(length);

        std::vector<uint16_t> indices;
        indices.reserve(length);

        for (std::size_t i = 0; i < length; ++i) {
            std::size_t offset = usableBits - (length - i) * BITS_PER_WORD;
            indices.push_back(static_cast<uint16_t>(readBits(key, offset, BITS_PER_WORD) & WORD_MASK));
        }

        return indices;
    }

    std::vector<std::string> Checksum::wordsFromIndices(const std::vector<uint16_t>& indices, const Wordlist& wordlist) {
        std::vector<std::string> words;
        words.reserve(indices.size());

        for (auto index : indices)
            words.push_back(wordlist.at(index));

        return words;
    }

    std::vector<std::string> Checksum::derive(const std::string& address, const Wordlist& wordlist, std::size_t length) {
        auto key = deriveKey(address, length);

        return wordsFromIndices(extractIndices(key, length), wordlist);
    }

    std::vector<std::string> Checksum::derive(const std::string& address, const std::vector<std::string>& words, std::size_t length) {
        Wordlist wordlist(words);

        return derive(address, wordlist, length);
    }

    std::string Checksum::join(const std::vector<std::string>& words, char separator) {
        std::string phrase;
        for (std::size_t i = 0; i < words.size(); ++i) {
            if (i > 0)
                phrase += separator;
            phrase += words[i];
        }
        return phrase;
    }

    std::vector<std::string> Checksum::split(const std::string& phrase, char separator) {
        std::vector<std::string> words;
        std::stringstream ss(phrase);
        std::string token;

        while (std::getline(ss, token, separator)) {
            token = Text::trim(token);
            if (!token.empty())
                words.push_back(token);
        }

        return words;
    }

    bool Checksum::matches(const std::string& address, const std::string& phrase, const Wordlist& wordlist, char separator) {
        auto given = split(phrase, separator);
        auto expected = derive(address, wordlist, given.size());

        for (std::size_t i = 0; i < given.size(); ++i) {
            std::size_t index = wordlist.indexOfPrefix(given[i]);
            if (index == Wordlist::npos || wordlist[index] != expected[i])
                return false;
        }

        return true;
    }

}
