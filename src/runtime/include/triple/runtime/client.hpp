#pragma once

#include "triple/runtime/call_context.hpp"
#include "triple/runtime/controller.hpp"
#include "triple/runtime/message.hpp"
#include "triple/runtime/option.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/serializer.hpp"
#include "triple/runtime/user_stream.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace triple::runtime
{

struct InvokeResult {
    std::shared_ptr<Message> reply;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }

    template <typename T>
    const T* as() const
    {
        return dynamic_cast<const T*>(reply.get());
    }
};

using UnaryMethod = std::function<InvokeResult(const CallContext&, const Message&)>;
using StreamingMethod = std::function<Result<std::shared_ptr<UserStream>>(const CallContext&)>;
using MethodHandler = std::variant<UnaryMethod, StreamingMethod>;
using MethodTable = std::unordered_map<std::string, MethodHandler>;

class Client;

// A stub's remote methods, registered by name when a schema-codec client is created.
class ServiceBinding
{
public:
    virtual ~ServiceBinding() = default;
    virtual void bind(Client& client, MethodTable& methods) const = 0;
};

/**
 * @brief Invokes remote methods over one controller.
 *
 * With the protobuf serializer calls go through the binding's method table;
 * with hessian2 any method is invoked by name on ctx.interface_key.
 */
class Client
{
public:
    static Result<std::unique_ptr<Client>> create(const ServiceBinding& binding, const Option& option);

    // Over an already connected socket, for in-process peers.
    static Result<std::unique_ptr<Client>> create(const ServiceBinding& binding,
                                                  std::shared_ptr<net::Socket> socket,
                                                  const Option& option);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    InvokeResult invoke(const CallContext& ctx, const std::string& method, const Message& request);

    // Unary call on an explicit path, bypassing the method table.
    Result<void> request(const CallContext& ctx, const std::string& path, const Message& arg, Message& reply);

    Result<std::shared_ptr<UserStream>> request_stream(const CallContext& ctx, const std::string& path);
    Result<std::shared_ptr<UserStream>> stream(const CallContext& ctx, const std::string& method);

    void close();
    bool is_available() const;

    const Option& option() const { return option_; }

private:
    Client(Option option, std::shared_ptr<Controller> controller);

    static Result<std::unique_ptr<Client>> finish_create(const ServiceBinding& binding,
                                                         Option option,
                                                         Result<std::shared_ptr<Controller>> controller);

    Result<std::shared_ptr<const Serializer>> serializer() const;

    Option option_;
    std::shared_ptr<Controller> controller_;
    std::shared_ptr<const Serializer> serializer_;
    std::optional<Error> serializer_error_;
    MethodTable methods_;
};

}  // namespace triple::runtime
