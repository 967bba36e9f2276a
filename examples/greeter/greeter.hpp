#pragma once

#include "triple/runtime/client.hpp"
#include "triple/runtime/message.hpp"
#include "triple/runtime/server.hpp"

#include "greeter.pb.h"

#include <string>
#include <string_view>

namespace greeter
{

inline constexpr std::string_view InterfaceKey = "greet.Greeter";
inline constexpr std::string_view SayHelloPath = "/greet.Greeter/SayHello";
inline constexpr std::string_view SayHelloStreamPath = "/greet.Greeter/SayHelloStream";

class HelloRequest : public triple::runtime::ProtoMessage<greet::HelloRequest>
{
public:
    HelloRequest() = default;
    explicit HelloRequest(std::string name);

    const std::string& name() const { return proto_.name(); }

    triple::runtime::Result<triple::runtime::hessian::Value> to_hessian() const override;
    triple::runtime::Result<void> from_hessian(const triple::runtime::hessian::Value& value) override;
};

class HelloReply : public triple::runtime::ProtoMessage<greet::HelloReply>
{
public:
    HelloReply() = default;
    explicit HelloReply(std::string message);

    const std::string& message() const { return proto_.message(); }

    triple::runtime::Result<triple::runtime::hessian::Value> to_hessian() const override;
    triple::runtime::Result<void> from_hessian(const triple::runtime::hessian::Value& value) override;
};

// SayHello is unary; SayHelloStream sends a reply for every request.
class GreeterBinding : public triple::runtime::ServiceBinding
{
public:
    void bind(triple::runtime::Client& client, triple::runtime::MethodTable& methods) const override;
};

void register_greeter(triple::runtime::Server& server);

}  // namespace greeter
