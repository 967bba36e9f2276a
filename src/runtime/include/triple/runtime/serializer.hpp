#pragma once

#include "triple/runtime/message.hpp"
#include "triple/runtime/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace triple::runtime
{

/**
 * @brief Turns messages into frame payloads and back.
 *
 * Implementations are stateless and shared between threads.
 */
class Serializer
{
public:
    virtual ~Serializer() = default;

    virtual std::string_view type() const = 0;

    virtual Result<std::vector<std::uint8_t>> marshal_request(const Message& request) const = 0;
    virtual Result<void> unmarshal_request(std::span<const std::uint8_t> payload, Message& request) const = 0;
    virtual Result<std::vector<std::uint8_t>> marshal_response(const Message& reply) const = 0;
    virtual Result<void> unmarshal_response(std::span<const std::uint8_t> payload, Message& reply) const = 0;
};

// Messages encode themselves in protobuf wire format, in both directions.
class ProtobufSerializer : public Serializer
{
public:
    std::string_view type() const override;

    Result<std::vector<std::uint8_t>> marshal_request(const Message& request) const override;
    Result<void> unmarshal_request(std::span<const std::uint8_t> payload, Message& request) const override;
    Result<std::vector<std::uint8_t>> marshal_response(const Message& reply) const override;
    Result<void> unmarshal_response(std::span<const std::uint8_t> payload, Message& reply) const override;
};

// Hessian2 values inside the Triple request/response wrappers.
class HessianWrapperSerializer : public Serializer
{
public:
    std::string_view type() const override;

    Result<std::vector<std::uint8_t>> marshal_request(const Message& request) const override;
    Result<void> unmarshal_request(std::span<const std::uint8_t> payload, Message& request) const override;
    Result<std::vector<std::uint8_t>> marshal_response(const Message& reply) const override;
    Result<void> unmarshal_response(std::span<const std::uint8_t> payload, Message& reply) const override;
};

// ConfigError for an unknown serializer name.
Result<std::shared_ptr<const Serializer>> make_serializer(std::string_view type);

}  // namespace triple::runtime
