#pragma once

#include "options.hpp"

namespace triple {

/**
 * @brief The entry point of the tri tool.
 *
 * This function is the entry point of tri and is separated
 * from main() for testability.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments.
 * @return int The exit code.
 */
int run(int argc, char* argv[]);

}  // namespace triple
