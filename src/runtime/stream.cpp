#include "triple/runtime/stream.hpp"

#include "triple/runtime/connection.hpp"

namespace triple::runtime
{

std::optional<std::string> find_metadata(const Metadata& metadata, std::string_view name)
{
    for (const auto& [key, value] : metadata) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

FrameQueue::FrameQueue(std::size_t capacity)
    : capacity_(capacity)
{
}

bool FrameQueue::push(Frame frame)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_ || frames_.size() >= capacity_) {
            return false;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_all();
    return true;
}

void FrameQueue::close(std::optional<Error> reason)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        reason_ = std::move(reason);
    }
    cv_.notify_all();
}

void FrameQueue::abort(Error reason)
{
    {
        std::lock_guard lock(mutex_);
        frames_.clear();
        if (!closed_) {
            closed_ = true;
            reason_ = std::move(reason);
        }
    }
    cv_.notify_all();
}

void FrameQueue::wake()
{
    std::lock_guard lock(mutex_);
    cv_.notify_all();
}

Result<Frame> FrameQueue::pop(const CallContext& ctx)
{
    std::weak_ptr<FrameQueue> weak = weak_from_this();
    auto registration = ctx.cancel.on_cancel([weak] {
        if (auto self = weak.lock()) {
            self->wake();
        }
    });

    std::unique_lock lock(mutex_);
    while (true) {
        if (!frames_.empty()) {
            Frame frame = std::move(frames_.front());
            frames_.pop_front();
            return frame;
        }
        if (closed_) {
            if (reason_) {
                return std::unexpected(*reason_);
            }
            return closed_result<Frame>();
        }
        if (ctx.cancel.is_cancelled()) {
            return unexpected_result<Frame>(ErrorCode::Cancelled, "receive cancelled");
        }
        if (ctx.deadline) {
            if (Clock::now() >= *ctx.deadline) {
                return unexpected_result<Frame>(ErrorCode::Timeout, "receive deadline exceeded");
            }
            cv_.wait_until(lock, *ctx.deadline);
        } else {
            cv_.wait(lock);
        }
    }
}

bool FrameQueue::closed() const
{
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t FrameQueue::size() const
{
    std::lock_guard lock(mutex_);
    return frames_.size();
}

Stream::Stream(StreamRole role, std::string path, CallContext ctx, std::weak_ptr<Connection> connection)
    : role_(role)
    , path_(std::move(path))
    , ctx_(std::move(ctx))
    , connection_(std::move(connection))
    , queue_(std::make_shared<FrameQueue>())
{
}

Result<void> Stream::send(Frame frame)
{
    auto connection = connection_.lock();
    if (!connection) {
        return unexpected_result(ErrorCode::Unavailable, "connection is gone");
    }
    switch (frame.type) {
        case FrameType::Data:
            return connection->write_data(*this, std::move(frame.payload));
        case FrameType::ServerStreamClose: {
            if (role_ != StreamRole::Server) {
                return unexpected_result(ErrorCode::InternalError, "only a server stream can be finished");
            }
            auto status = parse_status_frame(frame);
            if (!status) {
                return std::unexpected(status.error());
            }
            return connection->finish(*this, *status);
        }
    }
    return unexpected_result(ErrorCode::InternalError, "unknown frame type");
}

Result<Frame> Stream::receive(const CallContext& ctx)
{
    return queue_->pop(ctx);
}

Result<void> Stream::close_send()
{
    auto connection = connection_.lock();
    if (!connection) {
        return unexpected_result(ErrorCode::Unavailable, "connection is gone");
    }
    if (role_ == StreamRole::Server) {
        return connection->finish(*this, Status{});
    }
    return connection->close_send(*this);
}

void Stream::reset()
{
    if (auto connection = connection_.lock()) {
        connection->reset(*this);
    }
    queue_->abort(make_error(ErrorCode::Cancelled, "stream reset"));
    cancel_source_.cancel();
}

}  // namespace triple::runtime
