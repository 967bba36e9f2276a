#pragma once

#include "triple/runtime/error.hpp"

#include <expected>
#include <string>
#include <utility>

namespace triple::runtime
{

template <typename T>
using Result = std::expected<T, Error>;

template <typename T = void>
inline Result<T> unexpected_result(Error error)
{
    return std::unexpected(std::move(error));
}

template <typename T = void>
inline Result<T> unexpected_result(ErrorCode code, std::string message = {})
{
    return unexpected_result<T>(make_error(code, std::move(message)));
}

template <typename T = void>
inline Result<T> unimplemented_result(std::string message)
{
    return unexpected_result<T>(ErrorCode::Unimplemented, std::move(message));
}

// The orderly end of a stream. Readers loop until they see it.
template <typename T = void>
inline Result<T> closed_result(std::string message = "stream closed")
{
    return unexpected_result<T>(ErrorCode::StreamClosed, std::move(message));
}

template <typename T>
inline bool is_closed(const Result<T>& result)
{
    return !result && result.error().is(ErrorCode::StreamClosed);
}

}  // namespace triple::runtime
