#include "triple/runtime/serializer.hpp"

#include "triple/runtime/option.hpp"
#include "triple/runtime/package.hpp"
#include "triple/runtime/serialization/wrapper.hpp"

#include <string>

namespace triple::runtime
{
namespace
{

Result<std::vector<std::uint8_t>> encode_protobuf(const Message& message)
{
    const auto* proto = message.protobuf();
    if (proto == nullptr) {
        return unimplemented_result<std::vector<std::uint8_t>>("message has no protobuf encoding");
    }
    auto size = proto->ByteSizeLong();
    if (size > MaxMessageSize) {
        return unexpected_result<std::vector<std::uint8_t>>(
            ErrorCode::ResourceExhausted,
            proto->GetTypeName() + " of " + std::to_string(size) + " bytes exceeds limit");
    }
    std::vector<std::uint8_t> out(size);
    if (!proto->SerializeToArray(out.data(), static_cast<int>(out.size()))) {
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::CodecError,
                                                            "failed to serialize " + proto->GetTypeName());
    }
    return out;
}

Result<void> decode_protobuf(std::span<const std::uint8_t> payload, Message& message)
{
    auto* proto = message.mutable_protobuf();
    if (proto == nullptr) {
        return unimplemented_result("message has no protobuf decoding");
    }
    if (payload.size() > MaxMessageSize) {
        return unexpected_result(ErrorCode::ResourceExhausted,
                                 "payload of " + std::to_string(payload.size()) + " bytes exceeds limit");
    }
    if (!proto->ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        return unexpected_result(ErrorCode::CodecError, "failed to parse " + proto->GetTypeName());
    }
    return {};
}

Result<void> check_wrapper_type(const std::string& serialize_type)
{
    if (!serialize_type.empty() && serialize_type != HessianSerializerName) {
        return unexpected_result(ErrorCode::CodecError, "unexpected wrapped serialization '" + serialize_type + "'");
    }
    return {};
}

}  // namespace

std::string_view ProtobufSerializer::type() const
{
    return ProtobufSerializerName;
}

Result<std::vector<std::uint8_t>> ProtobufSerializer::marshal_request(const Message& request) const
{
    return encode_protobuf(request);
}

Result<void> ProtobufSerializer::unmarshal_request(std::span<const std::uint8_t> payload, Message& request) const
{
    return decode_protobuf(payload, request);
}

Result<std::vector<std::uint8_t>> ProtobufSerializer::marshal_response(const Message& reply) const
{
    return encode_protobuf(reply);
}

Result<void> ProtobufSerializer::unmarshal_response(std::span<const std::uint8_t> payload, Message& reply) const
{
    return decode_protobuf(payload, reply);
}

std::string_view HessianWrapperSerializer::type() const
{
    return HessianSerializerName;
}

Result<std::vector<std::uint8_t>> HessianWrapperSerializer::marshal_request(const Message& request) const
{
    auto arguments = request.to_hessian_arguments();
    if (!arguments) {
        return std::unexpected(arguments.error());
    }
    wrapper::RequestWrapper wrapped;
    wrapped.serialize_type = std::string(HessianSerializerName);
    for (const auto& argument : *arguments) {
        auto bytes = hessian::encode(argument);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        wrapped.args.push_back(std::move(*bytes));
        wrapped.arg_types.push_back(hessian::java_type_name(argument));
    }
    return wrapper::encode(wrapped);
}

Result<void> HessianWrapperSerializer::unmarshal_request(std::span<const std::uint8_t> payload,
                                                         Message& request) const
{
    auto wrapped = wrapper::decode_request(payload);
    if (!wrapped) {
        return std::unexpected(wrapped.error());
    }
    if (auto res = check_wrapper_type(wrapped->serialize_type); !res) {
        return res;
    }
    std::vector<hessian::Value> arguments;
    arguments.reserve(wrapped->args.size());
    for (const auto& bytes : wrapped->args) {
        auto value = hessian::decode(bytes);
        if (!value) {
            return std::unexpected(value.error());
        }
        arguments.push_back(std::move(*value));
    }
    return request.from_hessian_arguments(arguments);
}

Result<std::vector<std::uint8_t>> HessianWrapperSerializer::marshal_response(const Message& reply) const
{
    auto value = reply.to_hessian();
    if (!value) {
        return std::unexpected(value.error());
    }
    auto bytes = hessian::encode(*value);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    wrapper::ResponseWrapper wrapped;
    wrapped.serialize_type = std::string(HessianSerializerName);
    wrapped.data = std::move(*bytes);
    wrapped.type = hessian::java_type_name(*value);
    return wrapper::encode(wrapped);
}

Result<void> HessianWrapperSerializer::unmarshal_response(std::span<const std::uint8_t> payload,
                                                          Message& reply) const
{
    auto wrapped = wrapper::decode_response(payload);
    if (!wrapped) {
        return std::unexpected(wrapped.error());
    }
    if (auto res = check_wrapper_type(wrapped->serialize_type); !res) {
        return res;
    }
    if (wrapped->data.empty()) {
        return unexpected_result(ErrorCode::CodecError, "response carries no data");
    }
    auto value = hessian::decode(wrapped->data);
    if (!value) {
        return std::unexpected(value.error());
    }
    return reply.from_hessian(*value);
}

Result<std::shared_ptr<const Serializer>> make_serializer(std::string_view type)
{
    if (type == ProtobufSerializerName) {
        return std::make_shared<const ProtobufSerializer>();
    }
    if (type == HessianSerializerName) {
        return std::make_shared<const HessianWrapperSerializer>();
    }
    return unexpected_result<std::shared_ptr<const Serializer>>(
        ErrorCode::ConfigError, "unsupported serializer type '" + std::string(type) + "'");
}

}  // namespace triple::runtime
