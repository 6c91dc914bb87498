#include "../include/text.hpp"

#include <algorithm>
#include <cctype>

/**
 * @file text.cpp
 * @brief Implementation of the Text helpers.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        inline bool isContinuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }
    }

    std::string Text::trim(const std::string& s) {
        std::size_t begin = 0;
        std::size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(begin, end - begin);
    }

    std::string Text::toLower(const std::string& s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::size_t Text::codePoints(const std::string& s) {
        return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
            [](unsigned char c) { return !isContinuation(c); }));
    }

    std::string Text::leadingCodePoints(const std::string& s, std::size_t count) {
        std::size_t end = 0;
        std::size_t seen = 0;

        while (end < s.size()) {
            if (!isContinuation(static_cast<unsigned char>(s[end]))) {
                if (seen == count)
                    break;
                ++seen;
            }
            ++end;
        }

        return s.substr(0, end);
    }

}
