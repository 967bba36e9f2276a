#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace triple::runtime
{

enum class FrameType : std::uint8_t {
    Data = 0x00,               ///< one length-prefixed message
    ServerStreamClose = 0x01,  ///< end of a server response, carries status
};

inline std::string_view to_string(FrameType type)
{
    switch (type) {
        case FrameType::Data:
            return "DATA";
        case FrameType::ServerStreamClose:
            return "SERVER_STREAM_CLOSE";
    }
    return "UNKNOWN";
}

struct Frame {
    FrameType type = FrameType::Data;
    std::vector<std::uint8_t> payload;
};

}  // namespace triple::runtime
