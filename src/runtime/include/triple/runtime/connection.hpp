#pragma once

#include "triple/runtime/call_context.hpp"
#include "triple/runtime/option.hpp"
#include "triple/runtime/package.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/socket.hpp"
#include "triple/runtime/status.hpp"
#include "triple/runtime/stream.hpp"

#include <nghttp2/nghttp2.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace triple::runtime
{

enum class ConnectionRole { Client, Server };

/**
 * @brief One HTTP/2 session over a connected socket.
 *
 * A reader thread feeds inbound bytes to nghttp2 and sorts messages into the
 * receive queues of their streams. All session state is guarded by one mutex;
 * callers block only on queues or on send backpressure, never on the reader.
 */
class Connection : public std::enable_shared_from_this<Connection>
{
public:
    // Called on the reader thread for each new server stream, after the
    // session lock is released.
    using StreamAcceptor = std::function<void(std::shared_ptr<Stream>)>;

    // Starts the session; a client waits up to option.timeout for the peer SETTINGS.
    static Result<std::shared_ptr<Connection>> open(std::shared_ptr<net::Socket> socket,
                                                    ConnectionRole role,
                                                    const Option& option,
                                                    StreamAcceptor acceptor = {});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Result<std::shared_ptr<Stream>> open_stream(const CallContext& ctx, const std::string& path);

    bool is_available() const;
    std::size_t active_streams() const;

    // Sends GOAWAY, closes the socket and every stream. Idempotent.
    void shutdown();

private:
    friend class Stream;

    Connection(std::shared_ptr<net::Socket> socket, ConnectionRole role, const Option& option, StreamAcceptor acceptor);

    Result<void> start();
    void read_loop();
    void fail(Error error);

    // Stream operations.
    Result<void> write_data(Stream& stream, std::vector<std::uint8_t> bytes);
    Result<void> close_send(Stream& stream);
    Result<void> finish(Stream& stream, const Status& status);
    void reset(Stream& stream);

    // Require mutex_.
    Result<void> flush_locked();
    void fail_locked(const Error& error);
    void resume_locked(Stream& stream);
    Result<void> check_writable_locked(const Stream& stream) const;
    Result<void> start_response_locked(Stream& stream);
    void finish_inbound_locked(Stream& stream);
    void prepare_server_stream_locked(Stream& stream);
    void handle_goaway_locked(std::int32_t last_stream_id, std::uint32_t error_code);
    std::shared_ptr<Stream> find_stream_locked(std::int32_t id) const;
    Metadata request_headers(const CallContext& ctx, const std::string& path) const;

    // Runs deferred cancellations after releasing the lock.
    void run_cancellations(std::unique_lock<std::mutex>& lock);

    static ssize_t read_data(nghttp2_session* session,
                             std::int32_t stream_id,
                             std::uint8_t* buf,
                             std::size_t length,
                             std::uint32_t* data_flags,
                             nghttp2_data_source* source,
                             void* user_data);
    static int on_begin_headers(nghttp2_session* session, const nghttp2_frame* frame, void* user_data);
    static int on_header(nghttp2_session* session,
                         const nghttp2_frame* frame,
                         const std::uint8_t* name,
                         std::size_t namelen,
                         const std::uint8_t* value,
                         std::size_t valuelen,
                         std::uint8_t flags,
                         void* user_data);
    static int on_frame_recv(nghttp2_session* session, const nghttp2_frame* frame, void* user_data);
    static int on_data_chunk_recv(nghttp2_session* session,
                                  std::uint8_t flags,
                                  std::int32_t stream_id,
                                  const std::uint8_t* data,
                                  std::size_t len,
                                  void* user_data);
    static int on_stream_close(nghttp2_session* session, std::int32_t stream_id, std::uint32_t error_code, void* user_data);

    std::shared_ptr<net::Socket> socket_;
    ConnectionRole role_;
    Option option_;
    std::string authority_;
    StreamAcceptor acceptor_;
    TriplePackageHandler package_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::condition_variable send_cv_;
    nghttp2_session* session_ = nullptr;
    std::unordered_map<std::int32_t, std::shared_ptr<Stream>> streams_;
    std::vector<std::shared_ptr<Stream>> ready_streams_;
    std::vector<std::shared_ptr<Stream>> pending_cancels_;
    bool settings_received_ = false;
    bool goaway_ = false;
    bool closed_ = false;
    std::optional<Error> failure_;

    std::atomic<bool> shutdown_{false};
    std::thread reader_;
};

// Milliseconds in the grpc-timeout header format ("<n>m").
std::string format_grpc_timeout(std::chrono::milliseconds timeout);

// Eight-digit hour or minute values do not fit in nanoseconds, so longer
// timeouts are clamped to this.
constexpr std::chrono::nanoseconds MaxGrpcTimeout = std::chrono::hours(24 * 365 * 100);

std::optional<std::chrono::nanoseconds> parse_grpc_timeout(std::string_view text);

}  // namespace triple::runtime
