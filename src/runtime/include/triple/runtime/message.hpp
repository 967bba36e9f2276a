#pragma once

#include "triple/runtime/result.hpp"
#include "triple/runtime/serialization/hessian.hpp"

#include <google/protobuf/message_lite.h>

#include <utility>
#include <vector>

namespace triple::runtime
{

/**
 * @brief A request or reply payload.
 *
 * Schema-codec messages expose a generated protobuf message through
 * `protobuf`/`mutable_protobuf`; object-graph messages implement the
 * `hessian` conversions. A message only needs to support the codec it is
 * used with; the rest report `Unimplemented`.
 */
class Message
{
public:
    virtual ~Message() = default;

    // Null when the message has no protobuf form.
    virtual const google::protobuf::MessageLite* protobuf() const;
    virtual google::protobuf::MessageLite* mutable_protobuf();

    virtual Result<hessian::Value> to_hessian() const;
    virtual Result<void> from_hessian(const hessian::Value& value);

    // A request travels as an argument list; by default it is a single argument.
    virtual Result<std::vector<hessian::Value>> to_hessian_arguments() const;
    virtual Result<void> from_hessian_arguments(const std::vector<hessian::Value>& arguments);
};

// Backs a message with a generated protobuf type.
template <typename Proto>
class ProtoMessage : public Message
{
public:
    ProtoMessage() = default;
    explicit ProtoMessage(Proto proto)
        : proto_(std::move(proto))
    {
    }

    const google::protobuf::MessageLite* protobuf() const override { return &proto_; }
    google::protobuf::MessageLite* mutable_protobuf() override { return &proto_; }

    const Proto& proto() const { return proto_; }
    Proto& proto() { return proto_; }

protected:
    Proto proto_;
};

// Holds a decoded object-graph value as is.
class ValueMessage : public Message
{
public:
    ValueMessage() = default;
    explicit ValueMessage(hessian::Value value);

    Result<hessian::Value> to_hessian() const override;
    Result<void> from_hessian(const hessian::Value& value) override;

    const hessian::Value& value() const { return value_; }

private:
    hessian::Value value_;
};

// Raw argument list for calls made without a typed request.
class ArgumentsMessage : public Message
{
public:
    ArgumentsMessage() = default;
    explicit ArgumentsMessage(std::vector<hessian::Value> arguments);

    Result<hessian::Value> to_hessian() const override;
    Result<std::vector<hessian::Value>> to_hessian_arguments() const override;
    Result<void> from_hessian_arguments(const std::vector<hessian::Value>& arguments) override;

    const std::vector<hessian::Value>& arguments() const { return arguments_; }

private:
    std::vector<hessian::Value> arguments_;
};

}  // namespace triple::runtime
