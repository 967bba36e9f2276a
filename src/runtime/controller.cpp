#include "triple/runtime/controller.hpp"

namespace triple::runtime
{

Controller::Controller(std::string address, Option option, std::shared_ptr<Connection> connection)
    : address_(std::move(address))
    , option_(std::move(option))
    , connection_(std::move(connection))
{
}

Controller::~Controller()
{
    destroy();
}

Result<std::shared_ptr<Controller>> Controller::open(const std::string& address, const Option& option)
{
    Option validated = option;
    validated.validate();

    auto parsed = net::parse_address(address);
    if (!parsed) {
        validated.logger->error("invalid address '{}': {}", address, parsed.error().message);
        return std::unexpected(parsed.error());
    }
    auto socket = net::connect(*parsed, validated.timeout);
    if (!socket) {
        validated.logger->error("connect to {} failed: {}", address, socket.error().message);
        return std::unexpected(socket.error());
    }
    return attach(address, std::move(*socket), validated);
}

Result<std::shared_ptr<Controller>> Controller::open(std::shared_ptr<net::Socket> socket, const Option& option)
{
    Option validated = option;
    validated.validate();
    return attach(validated.location, std::move(socket), validated);
}

Result<std::shared_ptr<Controller>> Controller::attach(std::string address,
                                                       std::shared_ptr<net::Socket> socket,
                                                       const Option& option)
{
    auto connection = Connection::open(std::move(socket), ConnectionRole::Client, option);
    if (!connection) {
        option.logger->error("handshake with {} failed: {}", address, connection.error().message);
        return std::unexpected(connection.error());
    }
    option.logger->debug("connected to {}", address);
    return std::shared_ptr<Controller>(new Controller(std::move(address), option, std::move(*connection)));
}

Result<std::shared_ptr<Stream>> Controller::open_stream(const CallContext& ctx, const std::string& path)
{
    if (state() != State::Open) {
        return unexpected_result<std::shared_ptr<Stream>>(ErrorCode::Unavailable, "controller destroyed");
    }
    return connection_->open_stream(ctx, path);
}

Result<std::vector<std::uint8_t>> Controller::unary_call(const CallContext& ctx,
                                                         const std::string& path,
                                                         std::span<const std::uint8_t> request)
{
    CallContext call = ctx;
    if (!call.deadline) {
        call.set_timeout(option_.timeout);
    }

    auto data = package_.to_frame_data(request);
    if (!data) {
        return std::unexpected(data.error());
    }

    auto stream = open_stream(call, path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    auto& s = *stream;

    if (auto res = s->send(Frame{FrameType::Data, std::move(*data)}); !res) {
        s->reset();
        return std::unexpected(res.error());
    }
    if (auto res = s->close_send(); !res) {
        s->reset();
        return std::unexpected(res.error());
    }

    auto frame = s->receive(call);
    if (!frame) {
        if (frame.error().is(ErrorCode::Timeout) || frame.error().is(ErrorCode::Cancelled)) {
            s->reset();
        }
        return std::unexpected(frame.error());
    }

    // The reply only counts once the trailer arrives; a failing status after the message wins.
    auto tail = s->receive(call);
    if (tail) {
        s->reset();
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::CodecError,
                                                            "unary reply carried more than one message");
    }
    if (!is_closed(tail)) {
        if (tail.error().is(ErrorCode::Timeout) || tail.error().is(ErrorCode::Cancelled)) {
            s->reset();
        }
        return std::unexpected(tail.error());
    }
    return package_.from_frame_data(frame->payload);
}

Result<std::shared_ptr<Stream>> Controller::stream_call(const CallContext& ctx, const std::string& path)
{
    return open_stream(ctx, path);
}

bool Controller::is_available() const
{
    return state() == State::Open && connection_->is_available();
}

void Controller::destroy()
{
    State expected = State::Open;
    if (!state_.compare_exchange_strong(expected, State::Closing, std::memory_order_acq_rel)) {
        return;
    }
    connection_->shutdown();
    state_.store(State::Closed, std::memory_order_release);
    option_.logger->info("connection to {} destroyed", address_);
}

}  // namespace triple::runtime
