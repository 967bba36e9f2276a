#pragma once

#include "triple/runtime/call_context.hpp"
#include "triple/runtime/connection.hpp"
#include "triple/runtime/option.hpp"
#include "triple/runtime/package.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/socket.hpp"
#include "triple/runtime/stream.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace triple::runtime
{

/**
 * @brief Owns the single physical connection of a client.
 *
 * Calls made after destroy() fail with Unavailable. Teardown happens once no
 * matter how many threads race on it.
 */
class Controller
{
public:
    enum class State : std::uint8_t { Open, Closing, Closed };

    // Dials `address` and waits up to option.timeout for the HTTP/2 handshake.
    static Result<std::shared_ptr<Controller>> open(const std::string& address, const Option& option);
    static Result<std::shared_ptr<Controller>> open(std::shared_ptr<net::Socket> socket, const Option& option);

    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    Result<std::shared_ptr<Stream>> open_stream(const CallContext& ctx, const std::string& path);

    // One framed request, one framed reply. Without a deadline in `ctx` the
    // call is bounded by option.timeout.
    Result<std::vector<std::uint8_t>> unary_call(const CallContext& ctx,
                                                 const std::string& path,
                                                 std::span<const std::uint8_t> request);

    Result<std::shared_ptr<Stream>> stream_call(const CallContext& ctx, const std::string& path);

    bool is_available() const;
    State state() const { return state_.load(std::memory_order_acquire); }

    void destroy();

    const PackageHandler& package() const { return package_; }
    const Option& option() const { return option_; }
    const std::string& address() const { return address_; }

private:
    Controller(std::string address, Option option, std::shared_ptr<Connection> connection);

    static Result<std::shared_ptr<Controller>> attach(std::string address,
                                                      std::shared_ptr<net::Socket> socket,
                                                      const Option& option);

    std::string address_;
    Option option_;
    TriplePackageHandler package_;
    std::shared_ptr<Connection> connection_;
    std::atomic<State> state_{State::Open};
};

}  // namespace triple::runtime
