#pragma once

#include "triple/runtime/message.hpp"
#include "triple/runtime/option.hpp"

#include "test_messages.pb.h"

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <unistd.h>

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace triple::test
{

// A bare string in hessian.
class TextMessage : public runtime::ProtoMessage<Text>
{
public:
    TextMessage() = default;
    explicit TextMessage(std::string value)
    {
        proto_.set_value(std::move(value));
    }

    const std::string& value() const { return proto_.value(); }

    runtime::Result<runtime::hessian::Value> to_hessian() const override
    {
        return runtime::hessian::Value{proto_.value()};
    }

    runtime::Result<void> from_hessian(const runtime::hessian::Value& v) override
    {
        const auto* text = boost::get<std::string>(&v);
        if (text == nullptr) {
            return runtime::unexpected_result(runtime::ErrorCode::CodecError, "not a string");
        }
        proto_.set_value(*text);
        return {};
    }
};

// Collects log lines in memory; read text() only after the logging threads are done.
class CapturingLogger
{
public:
    CapturingLogger()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_))
        , logger_(std::make_shared<spdlog::logger>("test", sink_))
    {
        logger_->set_pattern("%l %v");
        logger_->set_level(spdlog::level::trace);
    }

    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

    std::string text()
    {
        logger_->flush();
        return out_.str();
    }

    std::size_t count(std::string_view needle)
    {
        auto all = text();
        std::size_t n = 0;
        for (auto pos = all.find(needle); pos != std::string::npos; pos = all.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

inline std::string unique_socket_address(std::string_view name)
{
    static std::atomic<int> counter{0};
    return "unix:/tmp/triple-test-" + std::to_string(::getpid()) + "-" + std::string(name) + "-" +
           std::to_string(counter.fetch_add(1)) + ".sock";
}

}  // namespace triple::test
