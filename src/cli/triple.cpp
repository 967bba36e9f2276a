#include "cli/triple.hpp"

#include "cli/json_value.hpp"
#include "cli/options.hpp"
#include "triple/runtime/client.hpp"
#include "triple/runtime/server.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <pthread.h>

namespace triple
{
namespace
{

// Calls are made by name, so there is nothing to bind.
class DynamicBinding : public runtime::ServiceBinding
{
public:
    void bind(runtime::Client&, runtime::MethodTable&) const override {}
};

runtime::Option make_option(const Options& opts)
{
    runtime::Option option;
    option.location = opts.address;
    option.serializer_type = opts.serializer;
    option.timeout = opts.timeout;
    option.buffer_size = opts.buffer_size;
    option.header_group = opts.group;
    option.header_app_version = opts.app_version;
    option.logger = spdlog::default_logger();
    option.validate();
    return option;
}

int serve(const runtime::Option& option)
{
    // Block the signals before any runtime thread exists so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto server = runtime::Server::create(option);
    if (!server) {
        spdlog::error("Failed to create server: {}", server.error().message);
        return 1;
    }
    (*server)->set_default_handler(runtime::unary_handler<runtime::ArgumentsMessage, runtime::ValueMessage>(
        [](const runtime::CallContext& ctx, const runtime::ArgumentsMessage& request) -> runtime::Result<runtime::ValueMessage> {
            spdlog::debug("echo call on {} with {} argument(s)", ctx.interface_key, request.arguments().size());
            if (request.arguments().empty()) {
                return runtime::ValueMessage{};
            }
            return runtime::ValueMessage{request.arguments().front()};
        }));
    if (auto res = (*server)->listen(); !res) {
        return 1;
    }

    int signal_number = 0;
    sigwait(&signals, &signal_number);
    spdlog::info("Received signal {}, shutting down", signal_number);
    (*server)->stop();
    (*server)->join();
    return 0;
}

int call(const runtime::Option& option, const Options& opts)
{
    nlohmann::json request_json;
    try {
        request_json = nlohmann::json::parse(opts.request);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Invalid JSON request: {}", e.what());
        return 1;
    }
    auto arguments = arguments_from_json(request_json);
    if (!arguments) {
        spdlog::error("Invalid request: {}", arguments.error().message);
        return 1;
    }

    DynamicBinding binding;
    auto client = runtime::Client::create(binding, option);
    if (!client) {
        return 1;
    }

    auto ctx = runtime::CallContext::with_interface(opts.interface_key);
    auto result = (*client)->invoke(ctx, opts.method, runtime::ArgumentsMessage{std::move(*arguments)});
    (*client)->close();
    if (!result.ok()) {
        spdlog::error("Call {}.{} failed: {}", opts.interface_key, opts.method, result.error->message);
        return 1;
    }

    const auto* reply = result.as<runtime::ValueMessage>();
    if (reply == nullptr) {
        spdlog::error("Call {}.{} returned no value", opts.interface_key, opts.method);
        return 1;
    }
    fmt::print("{}\n", to_json(reply->value()).dump(2));
    return 0;
}

}  // namespace

int run(int argc, char* argv[])
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print("{}", opts->help_message.value());
        return 0;
    }

    if (opts->verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    spdlog::debug("tri v{}.{}.{}", TRIPLE_VERSION_MAJOR, TRIPLE_VERSION_MINOR, TRIPLE_VERSION_PATCH);

    auto option = make_option(*opts);
    if (opts->serve) {
        return serve(option);
    }
    return call(option, *opts);
}

}  // namespace triple
