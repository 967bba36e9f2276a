#include "triple/runtime/package.hpp"

#include <algorithm>
#include <string>

namespace triple::runtime
{
namespace
{

inline void write_be32(std::uint8_t* dst, std::uint32_t value)
{
    dst[0] = static_cast<std::uint8_t>((value >> 24U) & 0xFFU);
    dst[1] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
    dst[2] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    dst[3] = static_cast<std::uint8_t>(value & 0xFFU);
}

inline std::uint32_t read_be32(const std::uint8_t* src)
{
    return (static_cast<std::uint32_t>(src[0]) << 24U) | (static_cast<std::uint32_t>(src[1]) << 16U) |
           (static_cast<std::uint32_t>(src[2]) << 8U) | static_cast<std::uint32_t>(src[3]);
}

Result<std::uint32_t> read_prefix(std::span<const std::uint8_t> prefix)
{
    if (prefix[0] != 0) {
        return unexpected_result<std::uint32_t>(ErrorCode::CodecError, "compressed messages are not supported");
    }
    auto length = read_be32(prefix.data() + 1);
    if (length > MaxMessageSize) {
        return unexpected_result<std::uint32_t>(ErrorCode::ResourceExhausted,
                                                "message of " + std::to_string(length) + " bytes exceeds limit");
    }
    return length;
}

}  // namespace

Result<std::vector<std::uint8_t>> TriplePackageHandler::to_frame_data(std::span<const std::uint8_t> payload) const
{
    if (payload.size() > MaxMessageSize) {
        return unexpected_result<std::vector<std::uint8_t>>(
            ErrorCode::ResourceExhausted,
            "message of " + std::to_string(payload.size()) + " bytes exceeds limit");
    }
    std::vector<std::uint8_t> frame(MessagePrefixSize + payload.size());
    frame[0] = 0;
    write_be32(frame.data() + 1, static_cast<std::uint32_t>(payload.size()));
    std::copy(payload.begin(), payload.end(), frame.begin() + MessagePrefixSize);
    return frame;
}

Result<std::vector<std::uint8_t>> TriplePackageHandler::from_frame_data(std::span<const std::uint8_t> frame) const
{
    if (frame.size() < MessagePrefixSize) {
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::CodecError, "truncated message prefix");
    }
    auto length = read_prefix(frame.first(MessagePrefixSize));
    if (!length) {
        return std::unexpected(length.error());
    }
    if (frame.size() - MessagePrefixSize != *length) {
        return unexpected_result<std::vector<std::uint8_t>>(
            ErrorCode::CodecError,
            "message length mismatch: prefix says " + std::to_string(*length) + ", got " +
                std::to_string(frame.size() - MessagePrefixSize));
    }
    auto body = frame.subspan(MessagePrefixSize);
    return std::vector<std::uint8_t>(body.begin(), body.end());
}

Result<std::optional<std::size_t>> TriplePackageHandler::frame_size(std::span<const std::uint8_t> prefix) const
{
    if (prefix.size() < MessagePrefixSize) {
        return std::optional<std::size_t>{};
    }
    auto length = read_prefix(prefix.first(MessagePrefixSize));
    if (!length) {
        return std::unexpected(length.error());
    }
    return std::optional<std::size_t>{MessagePrefixSize + *length};
}

}  // namespace triple::runtime
