#pragma once

#include "triple/runtime/error.hpp"
#include "triple/runtime/frame.hpp"
#include "triple/runtime/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace triple::runtime
{

// Status codes carried in the grpc-status trailer.
enum class GrpcStatus : std::uint32_t {
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    AlreadyExists = 6,
    PermissionDenied = 7,
    ResourceExhausted = 8,
    FailedPrecondition = 9,
    Aborted = 10,
    OutOfRange = 11,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
    DataLoss = 15,
    Unauthenticated = 16,
};

struct Status {
    GrpcStatus code = GrpcStatus::Ok;
    std::string message;

    bool ok() const
    {
        return code == GrpcStatus::Ok;
    }
};

std::string_view to_string(GrpcStatus status);

GrpcStatus to_grpc_status(const Error& error);
Status to_status(const Error& error);

// Converts a non-ok trailer status into the error reported to the caller.
Error to_error(const Status& status);

std::optional<GrpcStatus> parse_grpc_status(std::string_view text);

// grpc-message is percent-encoded on the wire.
std::string percent_encode(std::string_view text);
std::string percent_decode(std::string_view text);

// ServerStreamClose control frame; the payload is a google.rpc.Status message.
Frame make_status_frame(const Status& status);
Result<Status> parse_status_frame(const Frame& frame);

}  // namespace triple::runtime
