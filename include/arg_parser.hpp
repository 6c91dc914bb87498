#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "exceptions.hpp"

/**
 * @file arg_parser.hpp
 * @brief Small command line parser for the checkphrase tool.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @class ArgParseError
     * @brief Thrown on a malformed command line (missing value, bad number, unknown option).
     */
    class ArgParseError : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

    /**
     * @class ArgParser
     * @brief Splits argv into "--name value" options, value-less switches and positionals.
     *
     * "--name=value" is accepted too. Names listed as switches never consume
     * the next argument.
     */
    class ArgParser {
        public:
            /**
             * @throw ArgParseError If an option that takes a value has none.
             */
            ArgParser(int argc, const char* const argv[], const std::set<std::string>& switches = {});

            bool hasOption(const std::string& option) const;

            /**
             * @throw ArgParseError If the option is absent.
             */
            std::string getOption(const std::string& option) const;

            std::string getOption(const std::string& option, const std::string& defaultValue) const;

            /**
             * @brief Non-negative integer option.
             * @throw ArgParseError If the value is not a non-negative integer.
             */
            std::size_t getSize(const std::string& option, std::size_t defaultValue) const;

            /**
             * @brief Signed integer option.
             * @throw ArgParseError If the value is not an integer.
             */
            int getInt(const std::string& option, int defaultValue) const;

            const std::vector<std::string>& positionalArgs() const { return positional; }

            /**
             * @brief Options present on the command line that are not in `known`.
             */
            std::vector<std::string> unknownOptions(const std::set<std::string>& known) const;

        private:
            std::unordered_map<std::string, std::string> options;
            std::vector<std::string> positional;
    };

}

#endif
