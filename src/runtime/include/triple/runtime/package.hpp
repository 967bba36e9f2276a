#pragma once

#include "triple/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace triple::runtime
{

constexpr std::size_t MessagePrefixSize = 5;
constexpr std::uint32_t MaxMessageSize = 64U * 1024U * 1024U;

/**
 * @brief Translates serialized payloads to and from on-wire message frames.
 *
 * The handler is the only place that knows the frame layout and holds no
 * state, so one instance is shared by every stream of a connection.
 */
class PackageHandler
{
public:
    virtual ~PackageHandler() = default;

    // ResourceExhausted for payloads over MaxMessageSize, which no peer would accept.
    virtual Result<std::vector<std::uint8_t>> to_frame_data(std::span<const std::uint8_t> payload) const = 0;
    virtual Result<std::vector<std::uint8_t>> from_frame_data(std::span<const std::uint8_t> frame) const = 0;

    // Size of the complete frame starting at `prefix`, or nullopt while the
    // prefix itself is incomplete.
    virtual Result<std::optional<std::size_t>> frame_size(std::span<const std::uint8_t> prefix) const = 0;
};

// gRPC message framing: compressed flag, 4-byte big-endian length, payload.
class TriplePackageHandler : public PackageHandler
{
public:
    Result<std::vector<std::uint8_t>> to_frame_data(std::span<const std::uint8_t> payload) const override;
    Result<std::vector<std::uint8_t>> from_frame_data(std::span<const std::uint8_t> frame) const override;
    Result<std::optional<std::size_t>> frame_size(std::span<const std::uint8_t> prefix) const override;
};

}  // namespace triple::runtime
