#include "triple/runtime/message.hpp"

#include <string>

namespace triple::runtime
{

const google::protobuf::MessageLite* Message::protobuf() const
{
    return nullptr;
}

google::protobuf::MessageLite* Message::mutable_protobuf()
{
    return nullptr;
}

Result<hessian::Value> Message::to_hessian() const
{
    return unimplemented_result<hessian::Value>("message has no hessian encoding");
}

Result<void> Message::from_hessian(const hessian::Value&)
{
    return unimplemented_result("message has no hessian decoding");
}

Result<std::vector<hessian::Value>> Message::to_hessian_arguments() const
{
    auto value = to_hessian();
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::vector<hessian::Value>{std::move(*value)};
}

Result<void> Message::from_hessian_arguments(const std::vector<hessian::Value>& arguments)
{
    if (arguments.size() != 1) {
        return unexpected_result(ErrorCode::CodecError,
                                 "expected 1 argument, got " + std::to_string(arguments.size()));
    }
    return from_hessian(arguments.front());
}

ValueMessage::ValueMessage(hessian::Value value)
    : value_(std::move(value))
{
}

Result<hessian::Value> ValueMessage::to_hessian() const
{
    return value_;
}

Result<void> ValueMessage::from_hessian(const hessian::Value& value)
{
    value_ = value;
    return {};
}

ArgumentsMessage::ArgumentsMessage(std::vector<hessian::Value> arguments)
    : arguments_(std::move(arguments))
{
}

Result<hessian::Value> ArgumentsMessage::to_hessian() const
{
    if (arguments_.size() != 1) {
        return unexpected_result<hessian::Value>(ErrorCode::CodecError, "argument list is not a single value");
    }
    return arguments_.front();
}

Result<std::vector<hessian::Value>> ArgumentsMessage::to_hessian_arguments() const
{
    return arguments_;
}

Result<void> ArgumentsMessage::from_hessian_arguments(const std::vector<hessian::Value>& arguments)
{
    arguments_ = arguments;
    return {};
}

}  // namespace triple::runtime
