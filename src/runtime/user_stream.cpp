#include "triple/runtime/user_stream.hpp"

#include <fmt/format.h>

namespace triple::runtime
{
namespace
{

const char* role_name(StreamRole role)
{
    return role == StreamRole::Client ? "client" : "server";
}

}  // namespace

UserStream::UserStream(StreamRole role,
                       std::shared_ptr<Stream> stream,
                       std::shared_ptr<const Serializer> serializer,
                       std::shared_ptr<spdlog::logger> logger)
    : role_(role)
    , stream_(std::move(stream))
    , serializer_(std::move(serializer))
    , logger_(std::move(logger))
{
}

Result<void> UserStream::require_role(StreamRole expected, const char* operation) const
{
    if (role_ != expected) {
        return unimplemented_result(fmt::format("{} is not supported on a {} stream", operation, role_name(role_)));
    }
    return {};
}

Result<void> UserStream::send_message(const Message& message)
{
    auto payload =
        role_ == StreamRole::Client ? serializer_->marshal_request(message) : serializer_->marshal_response(message);
    if (!payload) {
        logger_->error("{}: cannot serialize message: {}", stream_->path(), payload.error().message);
        return std::unexpected(payload.error());
    }
    auto data = package_.to_frame_data(*payload);
    if (!data) {
        logger_->error("{}: cannot frame message: {}", stream_->path(), data.error().message);
        return std::unexpected(data.error());
    }
    if (auto res = stream_->send(Frame{FrameType::Data, std::move(*data)}); !res) {
        logger_->error("{}: send failed: {}", stream_->path(), res.error().message);
        return res;
    }
    return {};
}

Result<void> UserStream::receive_message(Message& message)
{
    auto frame = stream_->receive();
    if (!frame) {
        return std::unexpected(frame.error());
    }
    auto payload = package_.from_frame_data(frame->payload);
    if (!payload) {
        logger_->error("{}: cannot unframe message: {}", stream_->path(), payload.error().message);
        return std::unexpected(payload.error());
    }
    auto res = role_ == StreamRole::Client ? serializer_->unmarshal_response(*payload, message)
                                           : serializer_->unmarshal_request(*payload, message);
    if (!res) {
        logger_->error("{}: cannot decode message: {}", stream_->path(), res.error().message);
    }
    return res;
}

Result<void> UserStream::set_header(const Metadata&)
{
    return require_role(StreamRole::Server, "set_header");
}

Result<void> UserStream::send_header(const Metadata&)
{
    return require_role(StreamRole::Server, "send_header");
}

Result<void> UserStream::set_trailer(const Metadata&)
{
    return require_role(StreamRole::Server, "set_trailer");
}

Result<void> UserStream::finish(const Status& status)
{
    if (auto res = require_role(StreamRole::Server, "finish"); !res) {
        return res;
    }
    return stream_->send(make_status_frame(status));
}

Result<Metadata> UserStream::header()
{
    if (auto res = require_role(StreamRole::Client, "header"); !res) {
        return std::unexpected(res.error());
    }
    return Metadata{};
}

Result<Metadata> UserStream::trailer()
{
    if (auto res = require_role(StreamRole::Client, "trailer"); !res) {
        return std::unexpected(res.error());
    }
    return Metadata{};
}

Result<void> UserStream::close_send()
{
    return require_role(StreamRole::Client, "close_send");
}

Result<void> UserStream::close_request()
{
    if (auto res = require_role(StreamRole::Client, "close_request"); !res) {
        return res;
    }
    return stream_->close_send();
}

void UserStream::cancel()
{
    stream_->reset();
}

}  // namespace triple::runtime
