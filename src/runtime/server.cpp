#include "triple/runtime/server.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace triple::runtime
{
namespace
{

// Upper bound on concurrently running handlers for the built-in pool.
constexpr std::size_t kMaxHandlerThreads = 256;

}  // namespace

Server::Server(Option option, std::shared_ptr<const Serializer> serializer, std::shared_ptr<Executor> executor)
    : option_(std::move(option))
    , serializer_(std::move(serializer))
    , executor_(std::move(executor))
{
    if (!executor_) {
        auto threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());
        owned_executor_ = std::make_shared<ThreadPoolExecutor>(threads, kMaxHandlerThreads, option_.logger);
        executor_ = owned_executor_;
    }
}

Server::~Server()
{
    stop();
    join();
}

Result<std::unique_ptr<Server>> Server::create(const Option& option, std::shared_ptr<Executor> executor)
{
    Option validated = option;
    validated.validate();
    auto serializer = make_serializer(validated.serializer_type);
    if (!serializer) {
        validated.logger->error("{}", serializer.error().message);
        return std::unexpected(serializer.error());
    }
    return std::unique_ptr<Server>(new Server(std::move(validated), std::move(*serializer), std::move(executor)));
}

void Server::register_handler(std::string path, StreamHandler handler)
{
    std::lock_guard lock(handlers_mutex_);
    handlers_[std::move(path)] = std::move(handler);
}

void Server::set_default_handler(StreamHandler handler)
{
    std::lock_guard lock(handlers_mutex_);
    default_handler_ = std::move(handler);
}

std::optional<StreamHandler> Server::find_handler(const std::string& path) const
{
    std::lock_guard lock(handlers_mutex_);
    auto it = handlers_.find(path);
    if (it != handlers_.end()) {
        return it->second;
    }
    if (default_handler_) {
        return default_handler_;
    }
    return std::nullopt;
}

Result<void> Server::listen()
{
    if (listener_) {
        return unexpected_result(ErrorCode::ConfigError, "server is already listening");
    }
    auto address = net::parse_address(option_.location);
    if (!address) {
        option_.logger->error("invalid listen address '{}': {}", option_.location, address.error().message);
        return std::unexpected(address.error());
    }
    auto listener = net::listen(*address);
    if (!listener) {
        option_.logger->error("listen on {} failed: {}", option_.location, listener.error().message);
        return std::unexpected(listener.error());
    }
    listener_ = std::move(*listener);
    accept_thread_ = std::thread([this] { accept_loop(); });
    option_.logger->info("listening on {}", listener_->address().to_string());
    return {};
}

Result<net::Address> Server::address() const
{
    if (!listener_) {
        return unexpected_result<net::Address>(ErrorCode::ConfigError, "server is not listening");
    }
    return listener_->address();
}

void Server::accept_loop()
{
    while (!stop_requested_.load(std::memory_order_relaxed)) {
        auto socket = listener_->accept();
        if (!socket) {
            if (stop_requested_.load(std::memory_order_relaxed)) {
                break;
            }
            option_.logger->warn("accept failed on {}: {}", option_.location, socket.error().message);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (auto res = serve(std::move(*socket)); !res) {
            option_.logger->warn("connection setup failed on {}: {}", option_.location, res.error().message);
        }
    }
}

Result<void> Server::serve(std::shared_ptr<net::Socket> socket)
{
    if (stop_requested_.load(std::memory_order_acquire)) {
        return unexpected_result(ErrorCode::Unavailable, "server is stopped");
    }
    auto connection = Connection::open(std::move(socket), ConnectionRole::Server, option_,
                                       [this](std::shared_ptr<Stream> stream) {
                                           executor_->schedule([this, stream = std::move(stream)] { dispatch(stream); });
                                       });
    if (!connection) {
        return std::unexpected(connection.error());
    }

    std::unique_lock lock(connections_mutex_);
    if (stop_requested_.load(std::memory_order_acquire)) {
        lock.unlock();
        (*connection)->shutdown();
        return unexpected_result(ErrorCode::Unavailable, "server is stopped");
    }
    // Closed connections are dropped here rather than from their reader thread.
    std::erase_if(connections_, [](const auto& c) { return !c->is_available() && c->active_streams() == 0; });
    connections_.push_back(std::move(*connection));
    return {};
}

std::size_t Server::connection_count() const
{
    std::lock_guard lock(connections_mutex_);
    return static_cast<std::size_t>(
        std::count_if(connections_.begin(), connections_.end(), [](const auto& c) { return c->is_available(); }));
}

void Server::dispatch(const std::shared_ptr<Stream>& stream)
{
    UserStream user(StreamRole::Server, stream, serializer_, option_.logger);
    auto handler = find_handler(stream->path());
    Status status;
    if (!handler) {
        option_.logger->warn("no handler for {}", stream->path());
        status = Status{GrpcStatus::Unimplemented, "unknown method " + stream->path()};
    } else {
        try {
            status = (*handler)(user);
        } catch (const std::exception& ex) {
            option_.logger->error("handler for {} threw: {}", stream->path(), ex.what());
            status = Status{GrpcStatus::Internal, ex.what()};
        }
    }
    if (auto res = user.finish(status); !res) {
        option_.logger->debug("{}: response not finished: {}", stream->path(), res.error().message);
    }
}

void Server::stop()
{
    bool expected = false;
    if (!stop_requested_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    if (listener_) {
        listener_->close();
    }
    std::vector<std::shared_ptr<Connection>> snapshot;
    {
        std::lock_guard lock(connections_mutex_);
        snapshot.swap(connections_);
    }
    for (auto& connection : snapshot) {
        connection->shutdown();
    }
}

void Server::join()
{
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (owned_executor_) {
        owned_executor_->stop();
    }
    if (stop_requested_.load(std::memory_order_acquire) && listener_) {
        option_.logger->info("server on {} stopped", listener_->address().to_string());
        listener_.reset();
    }
}

}  // namespace triple::runtime
