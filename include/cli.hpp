#ifndef CLI_HPP
#define CLI_HPP

#include <ostream>

/**
 * @file cli.hpp
 * @brief Entry point of the checkphrase command line tool.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    enum ExitCode {
        EXIT_OK = 0,         // success
        EXIT_INCOMPLETE = 1, // mismatch, short wordlist, incomplete coverage, replay failure
        EXIT_USAGE = 2,      // bad command line
        EXIT_FATAL = 3       // any other error
    };

    /**
     * @brief Run one checkphrase command.
     *
     * Results go to `out`; log lines and usage errors go to stderr. Every
     * exception is caught and turned into an exit code.
     *
     * @param argc Argument count, argv[0] being the program name.
     * @param argv Arguments.
     * @param out Stream receiving the command output.
     * @return An ExitCode value.
     */
    int runCli(int argc, const char* const argv[], std::ostream& out);

}

#endif
