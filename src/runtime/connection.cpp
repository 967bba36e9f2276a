#include "triple/runtime/connection.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <string_view>

namespace triple::runtime
{
namespace
{

// Send backpressure threshold per stream.
constexpr std::size_t kMaxPendingBytes = 1024 * 1024;
constexpr std::uint32_t kMaxConcurrentStreams = 1000;
constexpr std::string_view kContentType = "application/grpc+proto";

std::string_view role_name(ConnectionRole role)
{
    return role == ConnectionRole::Client ? "client" : "server";
}

nghttp2_nv make_nv(const std::string& name, const std::string& value)
{
    return nghttp2_nv{reinterpret_cast<std::uint8_t*>(const_cast<char*>(name.data())),
                      reinterpret_cast<std::uint8_t*>(const_cast<char*>(value.data())),
                      name.size(),
                      value.size(),
                      NGHTTP2_NV_FLAG_NONE};
}

std::vector<nghttp2_nv> make_nva(const Metadata& headers)
{
    std::vector<nghttp2_nv> nva;
    nva.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        nva.push_back(make_nv(name, value));
    }
    return nva;
}

Metadata status_headers(const Status& status)
{
    Metadata headers;
    headers.emplace_back("grpc-status", std::to_string(static_cast<std::uint32_t>(status.code)));
    if (!status.message.empty()) {
        headers.emplace_back("grpc-message", percent_encode(status.message));
    }
    return headers;
}

Error reset_error(std::uint32_t error_code)
{
    ErrorCode code = ErrorCode::TransportError;
    switch (error_code) {
        case NGHTTP2_CANCEL:
            code = ErrorCode::Cancelled;
            break;
        case NGHTTP2_ENHANCE_YOUR_CALM:
            code = ErrorCode::ResourceExhausted;
            break;
        case NGHTTP2_REFUSED_STREAM:
            code = ErrorCode::Unavailable;
            break;
        default:
            break;
    }
    return make_error(code, fmt::format("stream reset: {}", nghttp2_http2_strerror(error_code)));
}

std::string default_authority(const std::string& location)
{
    auto address = net::parse_address(location);
    if (!address || address->kind == net::Address::Kind::Unix) {
        return "localhost";
    }
    return address->to_string();
}

}  // namespace

std::string format_grpc_timeout(std::chrono::milliseconds timeout)
{
    auto count = std::max<std::int64_t>(timeout.count(), 0);
    // The header allows at most eight digits.
    if (count > 99999999) {
        return std::to_string(count / 1000) + "S";
    }
    return std::to_string(count) + "m";
}

std::optional<std::chrono::nanoseconds> parse_grpc_timeout(std::string_view text)
{
    if (text.size() < 2 || text.size() > 9) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    auto digits = text.substr(0, text.size() - 1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value < 0) {
        return std::nullopt;
    }
    std::int64_t unit = 0;
    switch (text.back()) {
        case 'H':
            unit = std::chrono::nanoseconds(std::chrono::hours(1)).count();
            break;
        case 'M':
            unit = std::chrono::nanoseconds(std::chrono::minutes(1)).count();
            break;
        case 'S':
            unit = std::chrono::nanoseconds(std::chrono::seconds(1)).count();
            break;
        case 'm':
            unit = std::chrono::nanoseconds(std::chrono::milliseconds(1)).count();
            break;
        case 'u':
            unit = std::chrono::nanoseconds(std::chrono::microseconds(1)).count();
            break;
        case 'n':
            unit = 1;
            break;
        default:
            return std::nullopt;
    }
    if (value > MaxGrpcTimeout.count() / unit) {
        return MaxGrpcTimeout;
    }
    return std::chrono::nanoseconds(value * unit);
}

Connection::Connection(std::shared_ptr<net::Socket> socket,
                       ConnectionRole role,
                       const Option& option,
                       StreamAcceptor acceptor)
    : socket_(std::move(socket))
    , role_(role)
    , option_(option)
    , authority_(default_authority(option.location))
    , acceptor_(std::move(acceptor))
{
    option_.validate();
}

Connection::~Connection()
{
    shutdown();
    if (session_) {
        nghttp2_session_del(session_);
    }
}

Result<std::shared_ptr<Connection>> Connection::open(std::shared_ptr<net::Socket> socket,
                                                     ConnectionRole role,
                                                     const Option& option,
                                                     StreamAcceptor acceptor)
{
    if (!socket) {
        return unexpected_result<std::shared_ptr<Connection>>(ErrorCode::ConnectionError, "no socket");
    }
    auto connection =
        std::shared_ptr<Connection>(new Connection(std::move(socket), role, option, std::move(acceptor)));
    if (auto res = connection->start(); !res) {
        connection->shutdown();
        return std::unexpected(res.error());
    }
    return connection;
}

Result<void> Connection::start()
{
    nghttp2_session_callbacks* callbacks = nullptr;
    if (int rv = nghttp2_session_callbacks_new(&callbacks); rv != 0) {
        return unexpected_result(ErrorCode::InternalError, nghttp2_strerror(rv));
    }
    nghttp2_session_callbacks_set_on_begin_headers_callback(callbacks, &Connection::on_begin_headers);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, &Connection::on_header);
    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, &Connection::on_frame_recv);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, &Connection::on_data_chunk_recv);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, &Connection::on_stream_close);

    int rv = role_ == ConnectionRole::Client ? nghttp2_session_client_new(&session_, callbacks, this)
                                             : nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);
    if (rv != 0) {
        session_ = nullptr;
        return unexpected_result(ErrorCode::InternalError, fmt::format("nghttp2 session: {}", nghttp2_strerror(rv)));
    }

    {
        std::unique_lock lock(mutex_);
        std::vector<nghttp2_settings_entry> settings{{NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, kMaxConcurrentStreams}};
        if (role_ == ConnectionRole::Client) {
            settings.push_back({NGHTTP2_SETTINGS_ENABLE_PUSH, 0});
        }
        if (int res = nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, settings.data(), settings.size()); res != 0) {
            return unexpected_result(ErrorCode::InternalError, nghttp2_strerror(res));
        }
        if (auto res = flush_locked(); !res) {
            return unexpected_result(ErrorCode::ConnectionError, "http2 preface: " + res.error().message);
        }
    }

    reader_ = std::thread([this] { read_loop(); });

    if (role_ == ConnectionRole::Client) {
        std::unique_lock lock(mutex_);
        bool settled = state_cv_.wait_for(lock, option_.timeout, [this] { return settings_received_ || closed_; });
        if (failure_) {
            return unexpected_result(ErrorCode::ConnectionError, "http2 handshake: " + failure_->message);
        }
        if (closed_) {
            return unexpected_result(ErrorCode::ConnectionError, "connection closed during handshake");
        }
        if (!settled) {
            return unexpected_result(ErrorCode::Timeout,
                                     fmt::format("no SETTINGS from peer within {} ms", option_.timeout.count()));
        }
    }
    option_.logger->debug("http2 {} connection ready", role_name(role_));
    return {};
}

bool Connection::is_available() const
{
    std::lock_guard lock(mutex_);
    return !closed_ && !goaway_;
}

std::size_t Connection::active_streams() const
{
    std::lock_guard lock(mutex_);
    return streams_.size();
}

Metadata Connection::request_headers(const CallContext& ctx, const std::string& path) const
{
    Metadata headers{
        {":method", "POST"},
        {":scheme", "http"},
        {":path", path},
        {":authority", authority_},
        {"content-type", std::string(kContentType)},
        {"te", "trailers"},
        {"user-agent", fmt::format("triple-cpp/{}.{}.{}", TRIPLE_VERSION_MAJOR, TRIPLE_VERSION_MINOR, TRIPLE_VERSION_PATCH)},
    };
    if (!ctx.request_id.empty()) {
        headers.emplace_back("tri-req-id", ctx.request_id);
    }
    if (!option_.header_group.empty()) {
        headers.emplace_back("tri-service-group", option_.header_group);
    }
    if (!option_.header_app_version.empty()) {
        headers.emplace_back("tri-service-version", option_.header_app_version);
    }
    if (ctx.deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*ctx.deadline - Clock::now());
        headers.emplace_back("grpc-timeout", format_grpc_timeout(remaining));
    }
    return headers;
}

Result<std::shared_ptr<Stream>> Connection::open_stream(const CallContext& ctx, const std::string& path)
{
    if (role_ != ConnectionRole::Client) {
        return unexpected_result<std::shared_ptr<Stream>>(ErrorCode::InternalError,
                                                          "streams are opened by the client side");
    }
    auto stream = std::make_shared<Stream>(StreamRole::Client, path, ctx, weak_from_this());
    auto headers = request_headers(ctx, path);
    auto nva = make_nva(headers);

    std::unique_lock lock(mutex_);
    if (closed_ || goaway_) {
        return unexpected_result<std::shared_ptr<Stream>>(ErrorCode::Unavailable, "connection is not available");
    }
    nghttp2_data_provider provider{};
    provider.source.ptr = stream.get();
    provider.read_callback = &Connection::read_data;
    std::int32_t id = nghttp2_submit_request(session_, nullptr, nva.data(), nva.size(), &provider, stream.get());
    if (id < 0) {
        return unexpected_result<std::shared_ptr<Stream>>(ErrorCode::Unavailable,
                                                          fmt::format("submit request: {}", nghttp2_strerror(id)));
    }
    stream->id_ = id;
    streams_.emplace(id, stream);
    if (auto res = flush_locked(); !res) {
        fail_locked(res.error());
        run_cancellations(lock);
        return std::unexpected(res.error());
    }
    option_.logger->debug("stream {} opened for {}", id, path);
    return stream;
}

Result<void> Connection::check_writable_locked(const Stream& stream) const
{
    if (closed_) {
        return unexpected_result(ErrorCode::Unavailable, "connection closed");
    }
    if (stream.released_ || stream.send_closed_) {
        return closed_result("send side of the stream is closed");
    }
    return {};
}

Result<void> Connection::start_response_locked(Stream& stream)
{
    if (stream.response_started_) {
        return {};
    }
    Metadata headers{{":status", "200"}, {"content-type", std::string(kContentType)}};
    auto nva = make_nva(headers);
    nghttp2_data_provider provider{};
    provider.source.ptr = &stream;
    provider.read_callback = &Connection::read_data;
    if (int rv = nghttp2_submit_response(session_, stream.id_, nva.data(), nva.size(), &provider); rv != 0) {
        return unexpected_result(ErrorCode::TransportError, fmt::format("submit response: {}", nghttp2_strerror(rv)));
    }
    stream.response_started_ = true;
    return {};
}

Result<void> Connection::write_data(Stream& stream, std::vector<std::uint8_t> bytes)
{
    std::unique_lock lock(mutex_);
    if (auto res = check_writable_locked(stream); !res) {
        return res;
    }
    if (role_ == ConnectionRole::Server) {
        if (auto res = start_response_locked(stream); !res) {
            return res;
        }
    }
    stream.outbound_.insert(stream.outbound_.end(), bytes.begin(), bytes.end());
    resume_locked(stream);
    if (auto res = flush_locked(); !res) {
        fail_locked(res.error());
        run_cancellations(lock);
        return res;
    }

    const auto& deadline = stream.ctx_.deadline;
    while (stream.outbound_.size() - stream.outbound_offset_ > kMaxPendingBytes) {
        if (closed_) {
            return unexpected_result(ErrorCode::Unavailable, "connection closed while sending");
        }
        if (stream.released_) {
            return closed_result("stream closed while sending");
        }
        if (deadline) {
            if (Clock::now() >= *deadline) {
                return unexpected_result(ErrorCode::Timeout, "send deadline exceeded");
            }
            send_cv_.wait_until(lock, *deadline);
        } else {
            send_cv_.wait(lock);
        }
    }
    return {};
}

Result<void> Connection::close_send(Stream& stream)
{
    std::unique_lock lock(mutex_);
    if (auto res = check_writable_locked(stream); !res) {
        return res;
    }
    stream.send_closed_ = true;
    resume_locked(stream);
    if (auto res = flush_locked(); !res) {
        fail_locked(res.error());
        run_cancellations(lock);
        return res;
    }
    return {};
}

Result<void> Connection::finish(Stream& stream, const Status& status)
{
    std::unique_lock lock(mutex_);
    if (auto res = check_writable_locked(stream); !res) {
        return res;
    }
    stream.send_closed_ = true;
    if (!stream.response_started_) {
        // Trailers-only response.
        Metadata headers{{":status", "200"}, {"content-type", std::string(kContentType)}};
        for (auto& header : status_headers(status)) {
            headers.push_back(std::move(header));
        }
        auto nva = make_nva(headers);
        if (int rv = nghttp2_submit_response(session_, stream.id_, nva.data(), nva.size(), nullptr); rv != 0) {
            return unexpected_result(ErrorCode::TransportError, fmt::format("submit response: {}", nghttp2_strerror(rv)));
        }
        stream.response_started_ = true;
    } else {
        stream.trailers_ = status;
        resume_locked(stream);
    }
    if (auto res = flush_locked(); !res) {
        fail_locked(res.error());
        run_cancellations(lock);
        return res;
    }
    option_.logger->debug("stream {} finished with {}", stream.id_, to_string(status.code));
    return {};
}

void Connection::reset(Stream& stream)
{
    std::unique_lock lock(mutex_);
    if (closed_ || stream.released_ || stream.id_ <= 0) {
        return;
    }
    stream.send_closed_ = true;
    if (int rv = nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, stream.id_, NGHTTP2_CANCEL); rv != 0) {
        option_.logger->warn("reset of stream {} failed: {}", stream.id_, nghttp2_strerror(rv));
        return;
    }
    if (auto res = flush_locked(); !res) {
        fail_locked(res.error());
        run_cancellations(lock);
    }
}

void Connection::shutdown()
{
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::unique_lock lock(mutex_);
        if (session_ && !closed_) {
            nghttp2_submit_goaway(session_, NGHTTP2_FLAG_NONE, nghttp2_session_get_last_proc_stream_id(session_),
                                  NGHTTP2_NO_ERROR, nullptr, 0);
            if (auto res = flush_locked(); !res) {
                option_.logger->debug("GOAWAY not delivered: {}", res.error().message);
            }
        }
        if (!closed_) {
            closed_ = true;
            for (auto& [id, stream] : streams_) {
                stream->released_ = true;
                stream->queue_->close();
                pending_cancels_.push_back(stream);
            }
            streams_.clear();
        }
        send_cv_.notify_all();
        state_cv_.notify_all();
        run_cancellations(lock);
    }
    socket_->close();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

void Connection::read_loop()
{
    std::vector<std::uint8_t> buffer(option_.buffer_size);
    while (true) {
        auto received = socket_->read_some(buffer);
        if (!received) {
            fail(received.error());
            return;
        }

        std::vector<std::shared_ptr<Stream>> ready;
        bool done = false;
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return;
            }
            auto rv = nghttp2_session_mem_recv(session_, buffer.data(), *received);
            if (rv < 0) {
                fail_locked(make_error(ErrorCode::TransportError,
                                       fmt::format("http2 protocol error: {}", nghttp2_strerror(static_cast<int>(rv)))));
            } else if (auto res = flush_locked(); !res) {
                fail_locked(res.error());
            } else if (!nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_)) {
                fail_locked(make_error(ErrorCode::Unavailable, "http2 session finished"));
            }
            done = closed_;
            ready.swap(ready_streams_);
            run_cancellations(lock);
        }

        if (!done && acceptor_) {
            for (auto& stream : ready) {
                acceptor_(std::move(stream));
            }
        }
        if (done) {
            socket_->close();
            return;
        }
    }
}

void Connection::fail(Error error)
{
    std::unique_lock lock(mutex_);
    fail_locked(error);
    run_cancellations(lock);
}

void Connection::fail_locked(const Error& error)
{
    if (closed_) {
        return;
    }
    closed_ = true;
    failure_ = error;
    socket_->close();
    if (error.is(ErrorCode::Cancelled)) {
        option_.logger->debug("http2 {} connection closed", role_name(role_));
    } else {
        option_.logger->warn("http2 {} connection lost: {}", role_name(role_), error.message);
    }
    auto stream_error = make_error(ErrorCode::Unavailable, "connection lost: " + error.message);
    for (auto& [id, stream] : streams_) {
        stream->released_ = true;
        stream->queue_->close(stream_error);
        pending_cancels_.push_back(stream);
    }
    streams_.clear();
    send_cv_.notify_all();
    state_cv_.notify_all();
}

void Connection::run_cancellations(std::unique_lock<std::mutex>& lock)
{
    if (pending_cancels_.empty()) {
        return;
    }
    auto streams = std::move(pending_cancels_);
    pending_cancels_.clear();
    lock.unlock();
    for (auto& stream : streams) {
        stream->cancel_source_.cancel();
    }
    lock.lock();
}

Result<void> Connection::flush_locked()
{
    while (true) {
        const std::uint8_t* data = nullptr;
        auto size = nghttp2_session_mem_send(session_, &data);
        if (size < 0) {
            return unexpected_result(ErrorCode::TransportError,
                                     fmt::format("http2 send: {}", nghttp2_strerror(static_cast<int>(size))));
        }
        if (size == 0) {
            return {};
        }
        if (auto res = socket_->write_all(std::span<const std::uint8_t>(data, static_cast<std::size_t>(size))); !res) {
            return res;
        }
    }
}

void Connection::resume_locked(Stream& stream)
{
    if (stream.deferred_) {
        stream.deferred_ = false;
        nghttp2_session_resume_data(session_, stream.id_);
    }
}

std::shared_ptr<Stream> Connection::find_stream_locked(std::int32_t id) const
{
    auto it = streams_.find(id);
    if (it == streams_.end()) {
        return nullptr;
    }
    return it->second;
}

void Connection::prepare_server_stream_locked(Stream& stream)
{
    auto& ctx = stream.ctx_;
    ctx.cancel = stream.cancel_source_.token();
    if (auto request_id = find_metadata(stream.headers_, "tri-req-id")) {
        ctx.request_id = *request_id;
    }
    if (auto timeout = find_metadata(stream.headers_, "grpc-timeout")) {
        if (auto parsed = parse_grpc_timeout(*timeout)) {
            ctx.deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(*parsed);
        } else {
            option_.logger->warn("stream {}: malformed grpc-timeout '{}'", stream.id_, *timeout);
        }
    }
    // "/<interface>/<method>"
    std::string_view path = stream.path_;
    if (path.starts_with('/')) {
        path.remove_prefix(1);
    }
    ctx.interface_key = std::string(path.substr(0, path.find('/')));
}

void Connection::finish_inbound_locked(Stream& stream)
{
    if (!stream.inbound_.empty()) {
        stream.queue_->close(make_error(ErrorCode::CodecError, "stream ended inside a message"));
        return;
    }
    if (role_ == ConnectionRole::Server) {
        stream.queue_->close();
        return;
    }
    if (!stream.http_status_.empty() && stream.http_status_ != "200") {
        stream.queue_->close(make_error(ErrorCode::Unavailable, "unexpected HTTP status " + stream.http_status_));
        return;
    }
    if (!stream.received_status_) {
        stream.queue_->close(make_error(ErrorCode::RemoteError, "response ended without grpc-status"));
        return;
    }
    if (stream.received_status_->ok()) {
        stream.queue_->close();
    } else {
        stream.queue_->close(to_error(*stream.received_status_));
    }
}

void Connection::handle_goaway_locked(std::int32_t last_stream_id, std::uint32_t error_code)
{
    goaway_ = true;
    option_.logger->warn("peer sent GOAWAY (last stream {}, {})", last_stream_id, nghttp2_http2_strerror(error_code));
    if (role_ != ConnectionRole::Client) {
        return;
    }
    for (auto& [id, stream] : streams_) {
        if (id > last_stream_id) {
            stream->queue_->close(make_error(ErrorCode::Unavailable, "connection is draining"));
        }
    }
}

ssize_t Connection::read_data(nghttp2_session* session,
                              std::int32_t stream_id,
                              std::uint8_t* buf,
                              std::size_t length,
                              std::uint32_t* data_flags,
                              nghttp2_data_source* source,
                              void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    auto* stream = static_cast<Stream*>(source->ptr);

    std::size_t available = stream->outbound_.size() - stream->outbound_offset_;
    std::size_t count = std::min(length, available);
    if (count > 0) {
        std::memcpy(buf, stream->outbound_.data() + stream->outbound_offset_, count);
        stream->outbound_offset_ += count;
        if (stream->outbound_offset_ == stream->outbound_.size()) {
            stream->outbound_.clear();
            stream->outbound_offset_ = 0;
        }
        self->send_cv_.notify_all();
    }

    if (count == available && stream->send_closed_) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
        if (stream->trailers_) {
            *data_flags |= NGHTTP2_DATA_FLAG_NO_END_STREAM;
            auto trailers = status_headers(*stream->trailers_);
            auto nva = make_nva(trailers);
            if (nghttp2_submit_trailer(session, stream_id, nva.data(), nva.size()) != 0) {
                return NGHTTP2_ERR_CALLBACK_FAILURE;
            }
        }
        return static_cast<ssize_t>(count);
    }
    if (count == 0) {
        stream->deferred_ = true;
        return NGHTTP2_ERR_DEFERRED;
    }
    return static_cast<ssize_t>(count);
}

int Connection::on_begin_headers(nghttp2_session*, const nghttp2_frame* frame, void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    if (frame->hd.type != NGHTTP2_HEADERS || self->role_ != ConnectionRole::Server ||
        frame->headers.cat != NGHTTP2_HCAT_REQUEST) {
        return 0;
    }
    auto stream = std::make_shared<Stream>(StreamRole::Server, std::string{}, CallContext{}, self->weak_from_this());
    stream->id_ = frame->hd.stream_id;
    self->streams_.emplace(stream->id_, std::move(stream));
    return 0;
}

int Connection::on_header(nghttp2_session*,
                          const nghttp2_frame* frame,
                          const std::uint8_t* name,
                          std::size_t namelen,
                          const std::uint8_t* value,
                          std::size_t valuelen,
                          std::uint8_t,
                          void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    if (frame->hd.type != NGHTTP2_HEADERS) {
        return 0;
    }
    auto stream = self->find_stream_locked(frame->hd.stream_id);
    if (!stream) {
        return 0;
    }
    std::string_view key(reinterpret_cast<const char*>(name), namelen);
    std::string_view val(reinterpret_cast<const char*>(value), valuelen);

    if (self->role_ == ConnectionRole::Server) {
        if (key == ":path") {
            stream->path_ = std::string(val);
        } else if (!key.starts_with(':')) {
            stream->headers_.emplace_back(std::string(key), std::string(val));
        }
        return 0;
    }

    if (key == ":status") {
        stream->http_status_ = std::string(val);
    } else if (key == "grpc-status") {
        auto code = parse_grpc_status(val);
        if (!stream->received_status_) {
            stream->received_status_ = Status{};
        }
        stream->received_status_->code = code.value_or(GrpcStatus::Unknown);
    } else if (key == "grpc-message") {
        if (!stream->received_status_) {
            stream->received_status_ = Status{GrpcStatus::Unknown, {}};
        }
        stream->received_status_->message = percent_decode(val);
    } else if (!key.starts_with(':') && frame->headers.cat == NGHTTP2_HCAT_RESPONSE) {
        stream->headers_.emplace_back(std::string(key), std::string(val));
    }
    return 0;
}

int Connection::on_frame_recv(nghttp2_session*, const nghttp2_frame* frame, void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    switch (frame->hd.type) {
        case NGHTTP2_SETTINGS:
            if ((frame->hd.flags & NGHTTP2_FLAG_ACK) == 0) {
                self->settings_received_ = true;
                self->state_cv_.notify_all();
            }
            break;
        case NGHTTP2_HEADERS: {
            auto stream = self->find_stream_locked(frame->hd.stream_id);
            if (!stream) {
                break;
            }
            if (self->role_ == ConnectionRole::Server && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
                self->prepare_server_stream_locked(*stream);
                self->option_.logger->debug("stream {} accepted for {}", stream->id_, stream->path_);
                self->ready_streams_.push_back(stream);
            }
            if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
                self->finish_inbound_locked(*stream);
            }
            break;
        }
        case NGHTTP2_DATA:
            if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
                if (auto stream = self->find_stream_locked(frame->hd.stream_id)) {
                    self->finish_inbound_locked(*stream);
                }
            }
            break;
        case NGHTTP2_GOAWAY:
            self->handle_goaway_locked(frame->goaway.last_stream_id, frame->goaway.error_code);
            break;
        default:
            break;
    }
    return 0;
}

int Connection::on_data_chunk_recv(nghttp2_session* session,
                                   std::uint8_t,
                                   std::int32_t stream_id,
                                   const std::uint8_t* data,
                                   std::size_t len,
                                   void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    auto stream = self->find_stream_locked(stream_id);
    if (!stream || stream->queue_->closed()) {
        return 0;
    }
    stream->inbound_.insert(stream->inbound_.end(), data, data + len);

    while (true) {
        auto size = self->package_.frame_size(stream->inbound_);
        if (!size) {
            self->option_.logger->warn("stream {}: {}", stream_id, size.error().message);
            stream->inbound_.clear();
            stream->queue_->close(size.error());
            nghttp2_submit_rst_stream(session, NGHTTP2_FLAG_NONE, stream_id, NGHTTP2_INTERNAL_ERROR);
            return 0;
        }
        if (!*size || stream->inbound_.size() < **size) {
            return 0;
        }
        auto end = stream->inbound_.begin() + static_cast<std::ptrdiff_t>(**size);
        Frame frame{FrameType::Data, std::vector<std::uint8_t>(stream->inbound_.begin(), end)};
        stream->inbound_.erase(stream->inbound_.begin(), end);
        if (!stream->queue_->push(std::move(frame))) {
            self->option_.logger->warn("stream {}: receive queue overflow, resetting", stream_id);
            stream->inbound_.clear();
            stream->queue_->close(make_error(ErrorCode::ResourceExhausted, "receive queue overflow"));
            nghttp2_submit_rst_stream(session, NGHTTP2_FLAG_NONE, stream_id, NGHTTP2_ENHANCE_YOUR_CALM);
            return 0;
        }
    }
}

int Connection::on_stream_close(nghttp2_session*, std::int32_t stream_id, std::uint32_t error_code, void* user_data)
{
    auto* self = static_cast<Connection*>(user_data);
    auto it = self->streams_.find(stream_id);
    if (it == self->streams_.end()) {
        return 0;
    }
    auto stream = std::move(it->second);
    self->streams_.erase(it);
    stream->released_ = true;
    if (error_code != NGHTTP2_NO_ERROR) {
        stream->queue_->close(reset_error(error_code));
        self->pending_cancels_.push_back(stream);
    } else {
        stream->queue_->close();
    }
    self->send_cv_.notify_all();
    self->option_.logger->debug("stream {} closed", stream_id);
    return 0;
}

}  // namespace triple::runtime
