#pragma once

#include "triple/runtime/connection.hpp"
#include "triple/runtime/executor.hpp"
#include "triple/runtime/option.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/serializer.hpp"
#include "triple/runtime/socket.hpp"
#include "triple/runtime/status.hpp"
#include "triple/runtime/user_stream.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace triple::runtime
{

// Runs one call to completion; the returned status ends the response.
using StreamHandler = std::function<Status(UserStream& stream)>;

template <typename Request, typename Reply>
StreamHandler unary_handler(std::function<Result<Reply>(const CallContext&, const Request&)> fn)
{
    return [fn = std::move(fn)](UserStream& stream) -> Status {
        Request request;
        if (auto res = stream.receive_message(request); !res) {
            return to_status(res.error());
        }
        auto reply = fn(stream.context(), request);
        if (!reply) {
            return to_status(reply.error());
        }
        if (auto res = stream.send_message(*reply); !res) {
            return to_status(res.error());
        }
        return Status{};
    };
}

/**
 * @brief Accepts Triple calls and runs registered handlers on an executor.
 *
 * Handlers are looked up by the full request path ("/<interface>/<method>").
 * Calls to a path nobody registered end with UNIMPLEMENTED unless a default
 * handler is set.
 */
class Server
{
public:
    // Without an executor the server runs its own thread pool.
    static Result<std::unique_ptr<Server>> create(const Option& option, std::shared_ptr<Executor> executor = nullptr);

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void register_handler(std::string path, StreamHandler handler);

    // Serves paths without a registered handler.
    void set_default_handler(StreamHandler handler);

    // Binds option.location and starts accepting.
    Result<void> listen();
    Result<void> serve(std::shared_ptr<net::Socket> socket);

    // Address actually bound by listen().
    Result<net::Address> address() const;

    std::size_t connection_count() const;

    void stop();
    void join();

private:
    Server(Option option, std::shared_ptr<const Serializer> serializer, std::shared_ptr<Executor> executor);

    void accept_loop();
    void dispatch(const std::shared_ptr<Stream>& stream);
    std::optional<StreamHandler> find_handler(const std::string& path) const;

    Option option_;
    std::shared_ptr<const Serializer> serializer_;
    std::shared_ptr<Executor> executor_;
    std::shared_ptr<ThreadPoolExecutor> owned_executor_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, StreamHandler> handlers_;
    StreamHandler default_handler_;

    mutable std::mutex connections_mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;

    std::shared_ptr<net::Listener> listener_;
    std::thread accept_thread_;
    std::atomic<bool> stop_requested_{false};
};

}  // namespace triple::runtime
