#ifndef TEXT_HPP
#define TEXT_HPP

#include <cstddef>
#include <string>

/**
 * @file text.hpp
 * @brief Byte-string helpers shared by the wordlist, builder, filter and phrase parsing.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @class Text
     * @brief Trimming, ASCII lowercasing and UTF-8 aware length and prefix.
     *
     * Strings are UTF-8 bytes. Only ASCII whitespace and ASCII letters are
     * touched by trim() and toLower(); other bytes pass through unchanged.
     */
    class Text {
        public:
            /**
             * @brief Remove leading and trailing whitespace.
             */
            static std::string trim(const std::string& s);

            static std::string toLower(const std::string& s);

            /**
             * @brief Number of UTF-8 code points (continuation bytes are not counted).
             */
            static std::size_t codePoints(const std::string& s);

            /**
             * @brief The first `count` code points of a string, never splitting one.
             * @return The whole string if it has `count` code points or fewer.
             */
            static std::string leadingCodePoints(const std::string& s, std::size_t count);
    };

}

#endif
