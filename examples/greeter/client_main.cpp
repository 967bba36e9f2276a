#include "greeter.hpp"

#include <iostream>

int main()
{
    using namespace triple::runtime;

    Option option;
    option.location = "unix:/tmp/triple-greeter.sock";

    greeter::GreeterBinding binding;
    auto client = Client::create(binding, option);
    if (!client) {
        std::cerr << "Failed to connect to " << option.location << ": " << client.error().message << '\n';
        return 1;
    }

    auto ctx = CallContext::with_interface(std::string(greeter::InterfaceKey));
    auto result = (*client)->invoke(ctx, "SayHello", greeter::HelloRequest{"laurence"});
    if (!result.ok()) {
        std::cerr << "RPC failed: " << result.error->message << '\n';
        return 1;
    }
    std::cout << "Server replied: " << result.as<greeter::HelloReply>()->message() << '\n';

    auto stream = (*client)->stream(ctx, "SayHelloStream");
    if (!stream) {
        std::cerr << "Stream failed: " << stream.error().message << '\n';
        return 1;
    }
    for (const char* name : {"alice", "bob"}) {
        if (auto res = (*stream)->send_message(greeter::HelloRequest{name}); !res) {
            return 1;
        }
        greeter::HelloReply reply;
        if (auto res = (*stream)->receive_message(reply); !res) {
            std::cerr << "Receive failed: " << res.error().message << '\n';
            return 1;
        }
        std::cout << "Stream replied: " << reply.message() << '\n';
    }
    if (auto res = (*stream)->close_request(); !res) {
        std::cerr << "Close failed: " << res.error().message << '\n';
        return 1;
    }

    (*client)->close();
    return 0;
}
