#pragma once

#include "triple/runtime/call_context.hpp"
#include "triple/runtime/frame.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/status.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace triple::runtime
{

class Connection;

inline constexpr std::size_t ReceiveQueueCapacity = 1024;

enum class StreamRole { Client, Server };

using Metadata = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> find_metadata(const Metadata& metadata, std::string_view name);

/**
 * @brief Bounded queue of inbound frames for one stream.
 *
 * Frames pushed before close() are still handed out; after that every pop
 * fails with the close reason, or StreamClosed when the stream ended cleanly.
 * Must be owned by a shared_ptr.
 */
class FrameQueue : public std::enable_shared_from_this<FrameQueue>
{
public:
    explicit FrameQueue(std::size_t capacity = ReceiveQueueCapacity);

    // False when the queue is full or closed.
    bool push(Frame frame);

    // The first close wins; later calls are ignored.
    void close(std::optional<Error> reason = std::nullopt);

    // Closes and drops frames not yet received.
    void abort(Error reason);

    Result<Frame> pop(const CallContext& ctx);

    bool closed() const;
    std::size_t size() const;

private:
    void wake();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    std::size_t capacity_;
    bool closed_ = false;
    std::optional<Error> reason_;
};

/**
 * @brief One call multiplexed over a connection.
 *
 * Payloads passed to send() and returned by receive() are whole
 * length-prefixed messages; framing is the caller's business.
 */
class Stream
{
public:
    Stream(StreamRole role, std::string path, CallContext ctx, std::weak_ptr<Connection> connection);

    std::int32_t id() const { return id_; }
    StreamRole role() const { return role_; }
    const std::string& path() const { return path_; }

    // Request headers on the server, response headers on the client.
    const Metadata& headers() const { return headers_; }
    const CallContext& context() const { return ctx_; }

    // Data frames go out as HTTP/2 DATA; a ServerStreamClose frame ends a
    // server response with its status as trailers.
    Result<void> send(Frame frame);

    Result<Frame> receive(const CallContext& ctx);
    Result<Frame> receive() { return receive(ctx_); }

    // END_STREAM on the client; an OK finish on the server.
    Result<void> close_send();

    // RST_STREAM(CANCEL) and local close.
    void reset();

    bool receive_closed() const { return queue_->closed(); }

private:
    friend class Connection;

    std::int32_t id_ = -1;
    StreamRole role_;
    std::string path_;
    CallContext ctx_;
    Metadata headers_;
    std::weak_ptr<Connection> connection_;
    std::shared_ptr<FrameQueue> queue_;
    CancelSource cancel_source_;

    // Guarded by the connection mutex.
    std::vector<std::uint8_t> outbound_;
    std::size_t outbound_offset_ = 0;
    bool deferred_ = false;
    bool send_closed_ = false;
    bool response_started_ = false;
    bool released_ = false;
    std::optional<Status> trailers_;
    std::vector<std::uint8_t> inbound_;
    std::string http_status_;
    std::optional<Status> received_status_;
};

}  // namespace triple::runtime
