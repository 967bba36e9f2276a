#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace triple::runtime
{

enum class ErrorCode {
    Ok,
    TransportError,
    Timeout,
    Cancelled,
    InternalError,
    Unimplemented,
    ConfigError,
    ConnectionError,
    StreamClosed,
    CodecError,
    DispatchError,
    Unavailable,
    RemoteError,
    ResourceExhausted,
};

}  // namespace triple::runtime

namespace std
{

template <>
struct is_error_code_enum<triple::runtime::ErrorCode> : true_type {
};

}  // namespace std

namespace triple::runtime
{

class TripleErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "triple";
    }

    std::string message(int ev) const override
    {
        const auto code = static_cast<ErrorCode>(ev);
        switch (code) {
            case ErrorCode::Ok:
                return "ok";
            case ErrorCode::TransportError:
                return "transport error";
            case ErrorCode::Timeout:
                return "timeout";
            case ErrorCode::Cancelled:
                return "cancelled";
            case ErrorCode::InternalError:
                return "internal error";
            case ErrorCode::Unimplemented:
                return "unimplemented";
            case ErrorCode::ConfigError:
                return "configuration error";
            case ErrorCode::ConnectionError:
                return "connection error";
            case ErrorCode::StreamClosed:
                return "stream closed";
            case ErrorCode::CodecError:
                return "codec error";
            case ErrorCode::DispatchError:
                return "dispatch error";
            case ErrorCode::Unavailable:
                return "unavailable";
            case ErrorCode::RemoteError:
                return "remote error";
            case ErrorCode::ResourceExhausted:
                return "resource exhausted";
        }
        return "unknown";
    }
};

inline const std::error_category& triple_error_category()
{
    static TripleErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorCode code)
{
    return {static_cast<int>(code), triple_error_category()};
}

struct Error {
    std::error_code code = make_error_code(ErrorCode::InternalError);
    std::string message;

    Error() = default;

    Error(ErrorCode code_, std::string message_)
        : code(make_error_code(code_))
        , message(std::move(message_))
    {
    }

    Error(std::error_code code_, std::string message_)
        : code(std::move(code_))
        , message(std::move(message_))
    {
    }

    bool is(ErrorCode expected) const
    {
        return code == make_error_code(expected);
    }
};

inline Error make_error(ErrorCode code, std::string message = {})
{
    return Error{code, std::move(message)};
}

inline Error make_error(std::error_code code, std::string message = {})
{
    return Error{std::move(code), std::move(message)};
}

}  // namespace triple::runtime
