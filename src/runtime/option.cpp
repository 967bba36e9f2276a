#include "triple/runtime/option.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace triple::runtime
{

std::shared_ptr<spdlog::logger> make_default_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("triple", std::move(sink));
    logger->set_level(spdlog::level::info);
    return logger;
}

void Option::validate()
{
    if (timeout.count() == 0) {
        timeout = DefaultTimeout;
    }
    if (buffer_size == 0) {
        buffer_size = DefaultReadBufferSize;
    }
    if (location.empty()) {
        location = DefaultLocation;
    }
    if (!logger) {
        logger = make_default_logger();
    }
    if (protocol.empty()) {
        protocol = TripleProtocol;
    }
    if (serializer_type.empty()) {
        serializer_type = ProtobufSerializerName;
    }
}

}  // namespace triple::runtime
