#include "../include/cli.hpp"

#include <iostream>

/**
 * @file main.cpp
 * @brief checkphrase command line tool.
 * @author Athos-0day
 * @date 2026
 */

int main(int argc, char* argv[]) {
    return Checkphrase::runCli(argc, argv, std::cout);
}
