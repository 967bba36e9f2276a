#include "triple/runtime/status.hpp"

#include "status_frame.pb.h"

#include <charconv>
#include <string>

namespace triple::runtime
{

std::string_view to_string(GrpcStatus status)
{
    switch (status) {
        case GrpcStatus::Ok:
            return "OK";
        case GrpcStatus::Cancelled:
            return "CANCELLED";
        case GrpcStatus::Unknown:
            return "UNKNOWN";
        case GrpcStatus::InvalidArgument:
            return "INVALID_ARGUMENT";
        case GrpcStatus::DeadlineExceeded:
            return "DEADLINE_EXCEEDED";
        case GrpcStatus::NotFound:
            return "NOT_FOUND";
        case GrpcStatus::AlreadyExists:
            return "ALREADY_EXISTS";
        case GrpcStatus::PermissionDenied:
            return "PERMISSION_DENIED";
        case GrpcStatus::ResourceExhausted:
            return "RESOURCE_EXHAUSTED";
        case GrpcStatus::FailedPrecondition:
            return "FAILED_PRECONDITION";
        case GrpcStatus::Aborted:
            return "ABORTED";
        case GrpcStatus::OutOfRange:
            return "OUT_OF_RANGE";
        case GrpcStatus::Unimplemented:
            return "UNIMPLEMENTED";
        case GrpcStatus::Internal:
            return "INTERNAL";
        case GrpcStatus::Unavailable:
            return "UNAVAILABLE";
        case GrpcStatus::DataLoss:
            return "DATA_LOSS";
        case GrpcStatus::Unauthenticated:
            return "UNAUTHENTICATED";
    }
    return "UNKNOWN";
}

GrpcStatus to_grpc_status(const Error& error)
{
    if (error.code.category() != triple_error_category()) {
        return GrpcStatus::Unknown;
    }
    switch (static_cast<ErrorCode>(error.code.value())) {
        case ErrorCode::Ok:
            return GrpcStatus::Ok;
        case ErrorCode::Timeout:
            return GrpcStatus::DeadlineExceeded;
        case ErrorCode::Cancelled:
            return GrpcStatus::Cancelled;
        case ErrorCode::Unimplemented:
            return GrpcStatus::Unimplemented;
        case ErrorCode::CodecError:
            return GrpcStatus::InvalidArgument;
        case ErrorCode::DispatchError:
            return GrpcStatus::NotFound;
        case ErrorCode::Unavailable:
        case ErrorCode::ConnectionError:
        case ErrorCode::TransportError:
            return GrpcStatus::Unavailable;
        case ErrorCode::ResourceExhausted:
            return GrpcStatus::ResourceExhausted;
        case ErrorCode::ConfigError:
            return GrpcStatus::FailedPrecondition;
        case ErrorCode::StreamClosed:
            return GrpcStatus::Aborted;
        case ErrorCode::InternalError:
            return GrpcStatus::Internal;
        case ErrorCode::RemoteError:
            return GrpcStatus::Unknown;
    }
    return GrpcStatus::Unknown;
}

Status to_status(const Error& error)
{
    return Status{to_grpc_status(error), error.message};
}

Error to_error(const Status& status)
{
    ErrorCode code = ErrorCode::RemoteError;
    switch (status.code) {
        case GrpcStatus::Ok:
            code = ErrorCode::Ok;
            break;
        case GrpcStatus::Cancelled:
            code = ErrorCode::Cancelled;
            break;
        case GrpcStatus::DeadlineExceeded:
            code = ErrorCode::Timeout;
            break;
        case GrpcStatus::Unimplemented:
            code = ErrorCode::Unimplemented;
            break;
        case GrpcStatus::Unavailable:
            code = ErrorCode::Unavailable;
            break;
        case GrpcStatus::ResourceExhausted:
            code = ErrorCode::ResourceExhausted;
            break;
        default:
            break;
    }
    std::string message{to_string(status.code)};
    if (!status.message.empty()) {
        message += ": ";
        message += status.message;
    }
    return make_error(code, std::move(message));
}

std::optional<GrpcStatus> parse_grpc_status(std::string_view text)
{
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > 16) {
        return std::nullopt;
    }
    return static_cast<GrpcStatus>(value);
}

std::string percent_encode(std::string_view text)
{
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c >= 0x20 && c <= 0x7E && c != '%') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4U]);
            out.push_back(hex[c & 0x0FU]);
        }
    }
    return out;
}

namespace
{

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string percent_decode(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

Frame make_status_frame(const Status& status)
{
    pb::StatusFrame proto;
    proto.set_code(static_cast<std::int32_t>(status.code));
    proto.set_message(status.message);

    Frame frame;
    frame.type = FrameType::ServerStreamClose;
    frame.payload.resize(proto.ByteSizeLong());
    proto.SerializeWithCachedSizesToArray(frame.payload.data());
    return frame;
}

Result<Status> parse_status_frame(const Frame& frame)
{
    if (frame.type != FrameType::ServerStreamClose) {
        return unexpected_result<Status>(ErrorCode::CodecError, "not a stream close frame");
    }
    pb::StatusFrame proto;
    if (!proto.ParseFromArray(frame.payload.data(), static_cast<int>(frame.payload.size()))) {
        return unexpected_result<Status>(ErrorCode::CodecError, "malformed stream close frame");
    }
    if (proto.code() < 0 || proto.code() > 16) {
        return unexpected_result<Status>(ErrorCode::CodecError,
                                         "status code " + std::to_string(proto.code()) + " out of range");
    }
    Status status;
    status.code = static_cast<GrpcStatus>(proto.code());
    status.message = proto.message();
    return status;
}

}  // namespace triple::runtime
