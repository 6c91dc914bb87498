#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "wordlist.hpp"

/**
 * @file checksum.hpp
 * @brief Declaration of the Checksum class deriving checkphrases from addresses.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @class Checksum
     * @brief Derives a short word sequence (checkphrase) from an address string.
     *
     * Derivation:
     * key = PBKDF2(
     *   password = address (UTF-8 bytes),
     *   salt = "human-readable-checksum",
     *   iterations = 40000,
     *   HMAC-SHA256,
     *   dkLen = ceil(length * 11 / 8)
     * )
     * The key is read as a big-endian integer, shifted right by
     * (8 * dkLen) % 11 bits and split into 11-bit indices, most significant first.
     *
     * Every constant here is shared by all conforming implementations; changing
     * any of them changes every derived checkphrase.
     */
    class Checksum {
        public:
            static constexpr const char* SALT = "human-readable-checksum";
            static constexpr unsigned int ITERATIONS = 40000;
            static constexpr std::size_t DEFAULT_LENGTH = 5;
            static constexpr std::size_t MAX_LENGTH = 64;
            static constexpr std::size_t BITS_PER_WORD = 11;
            static constexpr uint16_t WORD_MASK = 0x7FF;

            /**
             * @brief Number of PBKDF2 output bytes needed for a checkphrase.
             * @param length Number of words (1 to MAX_LENGTH).
             * @return ceil(length * 11 / 8).
             * @throw ForbiddenSize If length is out of range.
             */
            static std::size_t keyLength(std::size_t length);

            /**
             * @brief Right shift applied to the key integer before splitting.
             * @param length Number of words (1 to MAX_LENGTH).
             * @return (8 * keyLength(length)) % 11.
             * @throw ForbiddenSize If length is out of range.
             */
            static std::size_t alignmentShift(std::size_t length);

            /**
             * @brief Run PBKDF2-HMAC-SHA256 over the address.
             * @param address Address bytes, hashed as given (no normalization).
             * @param length Number of words the key must feed.
             * @return keyLength(length) bytes of derived key.
             * @throw InvalidAddress If the address is empty.
             * @throw ForbiddenSize If length is out of range.
             * @throw CryptoException If PBKDF2 derivation fails.
             */
            static std::vector<uint8_t> deriveKey(const std::string& address, std::size_t length = DEFAULT_LENGTH);

            /**
             * @brief Convert a derived key into 11-bit word indices.
             *
             * Works on the big-endian byte buffer directly: each index is read as
             * an 11-bit window at a computed bit offset, so no wide integer type
             * is needed whatever the length.
             *
             * @param key Derived key, exactly keyLength(length) bytes.
             * @param length Number of indices to extract.
             * @return Indices in [0, 2047], most significant group first.
             * @throw ForbiddenSize If length is out of range or does not match the key size.
             */
            static std::vector<uint16_t> extractIndices(const std::vector<uint8_t>& key, std::size_t length);

            /**
             * @brief Map indices to words.
             * @throw std::out_of_range If an index is not below Wordlist::SIZE.
             */
            static std::vector<std::string> wordsFromIndices(const std::vector<uint16_t>& indices, const Wordlist& wordlist);

            /**
             * @brief Derive the checkphrase of an address.
             * @param address Non-empty address string.
             * @param wordlist Validated wordlist.
             * @param length Number of words (default 5).
             * @return The words, position 0 holding the highest-order bits.
             * @throw InvalidAddress If the address is empty.
             * @throw ForbiddenSize If length is out of range.
             * @throw CryptoException If PBKDF2 derivation fails.
             */
            static std::vector<std::string> derive(const std::string& address, const Wordlist& wordlist, std::size_t length = DEFAULT_LENGTH);

            /**
             * @brief Same as derive() but for an unvalidated word vector.
             *
             * The words are validated before any hashing takes place.
             *
             * @throw InvalidWordlist If the words do not form a valid wordlist.
             */
            static std::vector<std::string> derive(const std::string& address, const std::vector<std::string>& words, std::size_t length = DEFAULT_LENGTH);

            /**
             * @brief Join words with a separator ("alarm-banana-...").
             */
            static std::string join(const std::vector<std::string>& words, char separator = '-');

            /**
             * @brief Split a phrase on a separator.
             *
             * Tokens are trimmed of surrounding whitespace; empty tokens are dropped.
             */
            static std::vector<std::string> split(const std::string& phrase, char separator = '-');

            /**
             * @brief Check a phrase someone read out against an address.
             *
             * The phrase length decides how many words are derived. Each token
             * may be a full word or an abbreviation accepted by
             * Wordlist::indexOfPrefix().
             *
             * @return true if every position resolves to the derived word.
             * @throw InvalidAddress If the address is empty.
             * @throw ForbiddenSize If the phrase has no word or too many.
             */
            static bool matches(const std::string& address, const std::string& phrase, const Wordlist& wordlist, char separator = '-');
    };
}


#endif
