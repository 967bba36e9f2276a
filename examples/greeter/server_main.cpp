#include "greeter.hpp"

#include <iostream>

int main()
{
    triple::runtime::Option option;
    option.location = "unix:/tmp/triple-greeter.sock";

    auto server = triple::runtime::Server::create(option);
    if (!server) {
        std::cerr << "Failed to create server: " << server.error().message << '\n';
        return 1;
    }
    greeter::register_greeter(**server);

    if (auto res = (*server)->listen(); !res) {
        std::cerr << "Failed to listen on " << option.location << ": " << res.error().message << '\n';
        return 1;
    }

    std::cout << "Greeter server listening on " << option.location << std::endl;
    (*server)->join();
    return 0;
}
