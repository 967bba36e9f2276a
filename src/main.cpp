#include <spdlog/spdlog.h>

#include "cli/triple.hpp"

#include <csignal>

int main(int argc, char* argv[])
{
    // Writes to a peer that hung up must surface as errors, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    try {
        return triple::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("tri: {}", e.what());
        return 1;
    }
}
