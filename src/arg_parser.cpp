#include "../include/arg_parser.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

/**
 * @file arg_parser.cpp
 * @brief Implementation of the ArgParser class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    ArgParser::ArgParser(int argc, const char* const argv[], const std::set<std::string>& switches) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
                std::size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    options[arg.substr(0, eq)] = arg.substr(eq + 1);
                } else if (switches.count(arg) != 0) {
                    options[arg] = "";
                } else if (i + 1 < argc && std::string(argv[i + 1]).compare(0, 2, "--") != 0) {
                    options[arg] = argv[++i];
                } else {
                    throw ArgParseError("Option " + arg + " requires a value");
                }
            } else if (arg == "-h") {
                options["--help"] = "";
            } else {
                positional.push_back(arg);
            }
        }
    }

    bool ArgParser::hasOption(const std::string& option) const {
        return options.find(option) != options.end();
    }

    std::string ArgParser::getOption(const std::string& option) const {
        auto it = options.find(option);
        if (it == options.end())
            throw ArgParseError("Missing required option: " + option);
        return it->second;
    }

    std::string ArgParser::getOption(const std::string& option, const std::string& defaultValue) const {
        auto it = options.find(option);
        if (it == options.end())
            return defaultValue;
        return it->second;
    }

    std::size_t ArgParser::getSize(const std::string& option, std::size_t defaultValue) const {
        auto it = options.find(option);
        if (it == options.end())
            return defaultValue;

        const std::string& text = it->second;
        if (text.empty() || text[0] == '-' || text[0] == '+')
            throw ArgParseError("Option " + option + " expects a non-negative integer, got '" + text + "'");

        char* end = nullptr;
        errno = 0;
        unsigned long long value = std::strtoull(text.c_str(), &end, 10);
        if (errno != 0 || *end != '\0')
            throw ArgParseError("Option " + option + " expects a non-negative integer, got '" + text + "'");

        return static_cast<std::size_t>(value);
    }

    int ArgParser::getInt(const std::string& option, int defaultValue) const {
        auto it = options.find(option);
        if (it == options.end())
            return defaultValue;

        const std::string& text = it->second;
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(text.c_str(), &end, 10);
        if (text.empty() || errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX)
            throw ArgParseError("Option " + option + " expects an integer, got '" + text + "'");

        return static_cast<int>(value);
    }

    std::vector<std::string> ArgParser::unknownOptions(const std::set<std::string>& known) const {
        std::vector<std::string> unknown;
        for (const auto& entry : options) {
            if (known.count(entry.first) == 0)
                unknown.push_back(entry.first);
        }
        std::sort(unknown.begin(), unknown.end());
        return unknown;
    }

}
