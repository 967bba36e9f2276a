#include "greeter.hpp"

#include <string>

namespace greeter
{
namespace
{

using namespace triple::runtime;

// Accepts {class, field: "..."} or a bare string.
Result<std::string> string_from_hessian(const hessian::Value& value, const std::string& field)
{
    if (const auto* text = boost::get<std::string>(&value)) {
        return *text;
    }
    if (const auto* object = boost::get<hessian::Object>(&value)) {
        if (const auto* member = object->field(field)) {
            if (const auto* text = boost::get<std::string>(member)) {
                return *text;
            }
        }
    }
    return unexpected_result<std::string>(ErrorCode::CodecError,
                                          "expected an object with string field '" + field + "', got " +
                                              hessian::kind_name(value));
}

hessian::Value make_object(std::string class_name, std::string field, std::string text)
{
    hessian::Object object;
    object.class_name = std::move(class_name);
    object.set(std::move(field), hessian::Value{std::move(text)});
    return hessian::Value{std::move(object)};
}

}  // namespace

HelloRequest::HelloRequest(std::string name)
{
    proto_.set_name(std::move(name));
}

Result<hessian::Value> HelloRequest::to_hessian() const
{
    return make_object("greet.HelloRequest", "name", proto_.name());
}

Result<void> HelloRequest::from_hessian(const hessian::Value& value)
{
    auto text = string_from_hessian(value, "name");
    if (!text) {
        return std::unexpected(text.error());
    }
    proto_.set_name(std::move(*text));
    return {};
}

HelloReply::HelloReply(std::string message)
{
    proto_.set_message(std::move(message));
}

Result<hessian::Value> HelloReply::to_hessian() const
{
    return make_object("greet.HelloReply", "message", proto_.message());
}

Result<void> HelloReply::from_hessian(const hessian::Value& value)
{
    auto text = string_from_hessian(value, "message");
    if (!text) {
        return std::unexpected(text.error());
    }
    proto_.set_message(std::move(*text));
    return {};
}

void GreeterBinding::bind(Client& client, MethodTable& methods) const
{
    methods.emplace("SayHello", UnaryMethod([&client](const CallContext& ctx, const Message& request) {
                        auto reply = std::make_shared<HelloReply>();
                        if (auto res = client.request(ctx, std::string(SayHelloPath), request, *reply); !res) {
                            return InvokeResult{reply, res.error()};
                        }
                        return InvokeResult{reply, std::nullopt};
                    }));
    methods.emplace("SayHelloStream", StreamingMethod([&client](const CallContext& ctx) {
                        return client.request_stream(ctx, std::string(SayHelloStreamPath));
                    }));
}

void register_greeter(Server& server)
{
    server.register_handler(std::string(SayHelloPath),
                            unary_handler<HelloRequest, HelloReply>(
                                [](const CallContext&, const HelloRequest& request) -> Result<HelloReply> {
                                    return HelloReply{"Hello " + request.name()};
                                }));

    server.register_handler(std::string(SayHelloStreamPath), [](UserStream& stream) -> Status {
        while (true) {
            HelloRequest request;
            if (auto res = stream.receive_message(request); !res) {
                if (is_closed(res)) {
                    return Status{};
                }
                return to_status(res.error());
            }
            if (auto res = stream.send_message(HelloReply{"Hello " + request.name()}); !res) {
                return to_status(res.error());
            }
        }
    });
}

}  // namespace greeter
