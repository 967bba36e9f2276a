#include "cli/options.hpp"

#include "triple/runtime/option.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <boost/program_options.hpp>

namespace triple
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    unsigned timeout_ms = 0;

    // clang-format off
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("address,a", po::value<std::string>(&opts.address)->value_name("ADDR")
            ->default_value(std::string(runtime::DefaultLocation)),
            "Server address, \"host:port\" or \"unix:/path\". With --serve, the address to listen on.")
        ("serializer,s", po::value<std::string>(&opts.serializer)->value_name("NAME")
            ->default_value(std::string(runtime::HessianSerializerName)),
            "Payload serializer: hessian2 or protobuf")
        ("timeout,t", po::value<unsigned>(&timeout_ms)->value_name("MS")->default_value(0),
            "Call timeout in milliseconds, 0 for the default of 3000")
        ("buffer-size", po::value<std::uint32_t>(&opts.buffer_size)->value_name("BYTES")->default_value(0),
            "Socket read buffer size, 0 for the default of 4096")
        ("group", po::value<std::string>(&opts.group)->value_name("GROUP"), "Service group header")
        ("app-version", po::value<std::string>(&opts.app_version)->value_name("VERSION"), "Service version header")
        ("interface,i", po::value<std::string>(&opts.interface_key)->value_name("KEY"),
            "Remote interface, e.g. org.apache.dubbo.sample.UserProvider")
        ("method,m", po::value<std::string>(&opts.method)->value_name("NAME"), "Remote method")
        ("request,r", po::value<std::string>(&opts.request)->value_name("JSON")->default_value("[]"),
            "Request as JSON. An array is the argument list; any other value is the single argument.")
        ("serve", po::bool_switch(&opts.serve), "Run an echo server answering every method with its first argument")
        ("verbose,v", po::bool_switch(&opts.verbose), "Log at debug level");
    // clang-format on

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);

        if (vm.count("help")) {
            // if help is specified, return the options object with help set, ignore other options
            std::string prog_name = argc > 0 ? argv[0] : "tri";
            opts.help_message = fmt::format("Usage: {} <Options>:\n{}\n", prog_name, fmt::streamed(desc));
            return opts;
        }

        po::notify(vm);
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }

    opts.timeout = std::chrono::milliseconds(timeout_ms);
    if (!opts.serve) {
        if (opts.interface_key.empty()) {
            return std::unexpected("the option '--interface' is required for a call");
        }
        if (opts.method.empty()) {
            return std::unexpected("the option '--method' is required for a call");
        }
    }
    return opts;
}

}  // namespace triple
