#pragma once

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace triple::runtime
{

inline constexpr std::string_view TripleProtocol = "tri";
inline constexpr std::string_view ProtobufSerializerName = "protobuf";
inline constexpr std::string_view HessianSerializerName = "hessian2";

inline constexpr std::chrono::milliseconds DefaultTimeout{3000};
inline constexpr std::uint32_t DefaultReadBufferSize = 4096;
inline constexpr std::string_view DefaultLocation = "127.0.0.1:20001";

/**
 * @brief Connection and protocol parameters shared by clients and servers.
 *
 * Fields left at their zero value are filled in by validate(). The object is
 * not modified after validation.
 */
struct Option {
    // network
    std::chrono::milliseconds timeout{0};
    std::uint32_t buffer_size = 0;  ///< socket read chunk in bytes

    // service
    std::string location;         ///< "host:port" or "unix:/path"
    std::string protocol;         ///< only "tri" is spoken
    std::string serializer_type;  ///< "protobuf" or "hessian2"

    // passed through verbatim as tri-service-group / tri-service-version
    std::string header_group;
    std::string header_app_version;

    std::shared_ptr<spdlog::logger> logger;

    void validate();
};

// Builds the logger used when an Option does not carry one. It is not
// registered with spdlog's global registry.
std::shared_ptr<spdlog::logger> make_default_logger();

}  // namespace triple::runtime
