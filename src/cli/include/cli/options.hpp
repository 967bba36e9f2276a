#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace triple
{
/**
 * @brief Command line options
 */
struct Options {
    std::string address;                      ///< "host:port" or "unix:/path"
    std::string serializer;                   ///< "hessian2" or "protobuf"
    std::chrono::milliseconds timeout{0};     ///< call timeout, 0 for the runtime default
    std::uint32_t buffer_size = 0;            ///< socket read chunk, 0 for the runtime default
    std::string group;                        ///< tri-service-group header
    std::string app_version;                  ///< tri-service-version header
    std::string interface_key;                ///< remote interface of the call
    std::string method;                       ///< remote method of the call
    std::string request;                      ///< JSON request, an array is an argument list
    std::optional<std::string> help_message;  ///< if specified, show help message
    bool serve = false;                       ///< if true, run an echo server instead of calling
    bool verbose = false;                     ///< if true, log at debug level
};

/**
 * @brief Parse command line options
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

}  // namespace triple
