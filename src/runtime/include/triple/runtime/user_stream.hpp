#pragma once

#include "triple/runtime/message.hpp"
#include "triple/runtime/package.hpp"
#include "triple/runtime/result.hpp"
#include "triple/runtime/serializer.hpp"
#include "triple/runtime/status.hpp"
#include "triple/runtime/stream.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace triple::runtime
{

/**
 * @brief Message-level view of a stream for stubs and handlers.
 *
 * The client role sends requests and receives replies; the server role does
 * the opposite. Metadata calls are accepted on the matching role and do
 * nothing; on the other role they report Unimplemented.
 */
class UserStream
{
public:
    UserStream(StreamRole role,
               std::shared_ptr<Stream> stream,
               std::shared_ptr<const Serializer> serializer,
               std::shared_ptr<spdlog::logger> logger);

    StreamRole role() const { return role_; }
    const CallContext& context() const { return stream_->context(); }
    const std::shared_ptr<Stream>& stream() const { return stream_; }

    Result<void> send_message(const Message& message);

    // StreamClosed once the peer has finished sending.
    Result<void> receive_message(Message& message);

    // Server role.
    Result<void> set_header(const Metadata& metadata);
    Result<void> send_header(const Metadata& metadata);
    Result<void> set_trailer(const Metadata& metadata);
    Result<void> finish(const Status& status);

    // Client role.
    Result<Metadata> header();
    Result<Metadata> trailer();
    Result<void> close_send();  ///< no-op, the call ends with close_request() or finish()
    Result<void> close_request();

    void cancel();

private:
    Result<void> require_role(StreamRole expected, const char* operation) const;

    StreamRole role_;
    std::shared_ptr<Stream> stream_;
    std::shared_ptr<const Serializer> serializer_;
    std::shared_ptr<spdlog::logger> logger_;
    TriplePackageHandler package_;
};

}  // namespace triple::runtime
