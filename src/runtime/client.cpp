#include "triple/runtime/client.hpp"

namespace triple::runtime
{
namespace
{

InvokeResult failed(Error error)
{
    return InvokeResult{std::make_shared<ValueMessage>(), std::move(error)};
}

}  // namespace

Client::Client(Option option, std::shared_ptr<Controller> controller)
    : option_(std::move(option))
    , controller_(std::move(controller))
{
}

Client::~Client()
{
    close();
}

Result<std::unique_ptr<Client>> Client::create(const ServiceBinding& binding, const Option& option)
{
    Option validated = option;
    validated.validate();
    auto controller = Controller::open(validated.location, validated);
    return finish_create(binding, std::move(validated), std::move(controller));
}

Result<std::unique_ptr<Client>> Client::create(const ServiceBinding& binding,
                                               std::shared_ptr<net::Socket> socket,
                                               const Option& option)
{
    Option validated = option;
    validated.validate();
    auto controller = Controller::open(std::move(socket), validated);
    return finish_create(binding, std::move(validated), std::move(controller));
}

Result<std::unique_ptr<Client>> Client::finish_create(const ServiceBinding& binding,
                                                      Option option,
                                                      Result<std::shared_ptr<Controller>> controller)
{
    if (!controller) {
        return std::unexpected(controller.error());
    }
    std::unique_ptr<Client> client(new Client(std::move(option), std::move(*controller)));

    // An unknown serializer is reported by the first call, not here.
    if (auto serializer = make_serializer(client->option_.serializer_type)) {
        client->serializer_ = std::move(*serializer);
    } else {
        client->serializer_error_ = serializer.error();
    }
    if (client->serializer_ && client->serializer_->type() == ProtobufSerializerName) {
        binding.bind(*client, client->methods_);
    }
    return client;
}

Result<std::shared_ptr<const Serializer>> Client::serializer() const
{
    if (!serializer_) {
        option_.logger->error("{}", serializer_error_->message);
        return std::unexpected(*serializer_error_);
    }
    return serializer_;
}

InvokeResult Client::invoke(const CallContext& ctx, const std::string& method, const Message& request)
{
    auto codec = serializer();
    if (!codec) {
        return failed(codec.error());
    }

    if ((*codec)->type() == HessianSerializerName) {
        auto reply = std::make_shared<ValueMessage>();
        auto path = "/" + ctx.interface_key + "/" + method;
        if (auto res = this->request(ctx, path, request, *reply); !res) {
            return failed(res.error());
        }
        return InvokeResult{std::move(reply), std::nullopt};
    }

    auto it = methods_.find(method);
    if (it == methods_.end()) {
        option_.logger->error("no method named '{}'", method);
        return failed(make_error(ErrorCode::DispatchError, "unknown method '" + method + "'"));
    }
    auto* unary = std::get_if<UnaryMethod>(&it->second);
    if (unary == nullptr) {
        option_.logger->error("method '{}' is a streaming method", method);
        return failed(make_error(ErrorCode::DispatchError, "method '" + method + "' is streaming"));
    }
    return (*unary)(ctx, request);
}

Result<void> Client::request(const CallContext& ctx, const std::string& path, const Message& arg, Message& reply)
{
    auto codec = serializer();
    if (!codec) {
        return std::unexpected(codec.error());
    }
    auto payload = (*codec)->marshal_request(arg);
    if (!payload) {
        option_.logger->error("{}: cannot serialize request: {}", path, payload.error().message);
        return std::unexpected(payload.error());
    }
    auto response = controller_->unary_call(ctx, path, *payload);
    if (!response) {
        option_.logger->error("{}: call failed: {}", path, response.error().message);
        return std::unexpected(response.error());
    }
    if (auto res = (*codec)->unmarshal_response(*response, reply); !res) {
        option_.logger->error("{}: cannot deserialize reply: {}", path, res.error().message);
        return res;
    }
    return {};
}

Result<std::shared_ptr<UserStream>> Client::request_stream(const CallContext& ctx, const std::string& path)
{
    auto codec = serializer();
    if (!codec) {
        return std::unexpected(codec.error());
    }
    auto stream = controller_->stream_call(ctx, path);
    if (!stream) {
        option_.logger->error("{}: cannot open stream: {}", path, stream.error().message);
        return std::unexpected(stream.error());
    }
    return std::make_shared<UserStream>(StreamRole::Client, std::move(*stream), std::move(*codec), option_.logger);
}

Result<std::shared_ptr<UserStream>> Client::stream(const CallContext& ctx, const std::string& method)
{
    auto it = methods_.find(method);
    if (it == methods_.end()) {
        return unexpected_result<std::shared_ptr<UserStream>>(ErrorCode::DispatchError,
                                                              "unknown method '" + method + "'");
    }
    auto* streaming = std::get_if<StreamingMethod>(&it->second);
    if (streaming == nullptr) {
        return unexpected_result<std::shared_ptr<UserStream>>(ErrorCode::DispatchError,
                                                              "method '" + method + "' is unary");
    }
    return (*streaming)(ctx);
}

void Client::close()
{
    if (controller_) {
        controller_->destroy();
    }
}

bool Client::is_available() const
{
    return controller_ && controller_->is_available();
}

}  // namespace triple::runtime
