#include "triple/runtime/stream.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace triple::runtime;
using namespace std::chrono_literals;

namespace
{

Frame data_frame(std::uint8_t marker)
{
    Frame frame;
    frame.payload = {marker};
    return frame;
}

}  // namespace

TEST(FrameQueue, DeliversInOrderThenReportsClosed)
{
    auto queue = std::make_shared<FrameQueue>();
    ASSERT_TRUE(queue->push(data_frame(1)));
    ASSERT_TRUE(queue->push(data_frame(2)));
    queue->close();
    EXPECT_FALSE(queue->push(data_frame(3)));

    CallContext ctx;
    auto first = queue->pop(ctx);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->payload.front(), 1);
    auto second = queue->pop(ctx);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->payload.front(), 2);

    auto end = queue->pop(ctx);
    ASSERT_FALSE(end);
    EXPECT_TRUE(is_closed(end));
}

TEST(Result, ClosedIsDistinctFromFailure)
{
    EXPECT_TRUE(is_closed(closed_result<int>()));
    EXPECT_EQ(closed_result<int>().error().message, "stream closed");
    EXPECT_FALSE(is_closed(Result<int>{7}));
    EXPECT_FALSE(is_closed(unexpected_result<int>(ErrorCode::Timeout, "too slow")));
    EXPECT_FALSE(is_closed(unimplemented_result()));
}

TEST(FrameQueue, CloseReasonIsReportedOnce)
{
    auto queue = std::make_shared<FrameQueue>();
    queue->close(make_error(ErrorCode::ConnectionError, "peer went away"));
    queue->close(make_error(ErrorCode::Cancelled, "ignored"));

    auto res = queue->pop(CallContext{});
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::ConnectionError));
    EXPECT_EQ(res.error().message, "peer went away");
}

TEST(FrameQueue, AbortDropsPendingFrames)
{
    auto queue = std::make_shared<FrameQueue>();
    ASSERT_TRUE(queue->push(data_frame(1)));
    queue->abort(make_error(ErrorCode::Cancelled, "reset"));
    EXPECT_EQ(queue->size(), 0u);

    auto res = queue->pop(CallContext{});
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Cancelled));
}

TEST(FrameQueue, RejectsPushWhenFull)
{
    auto queue = std::make_shared<FrameQueue>(2);
    EXPECT_TRUE(queue->push(data_frame(1)));
    EXPECT_TRUE(queue->push(data_frame(2)));
    EXPECT_FALSE(queue->push(data_frame(3)));
    EXPECT_EQ(queue->size(), 2u);
}

TEST(FrameQueue, PopTimesOutAtDeadline)
{
    auto queue = std::make_shared<FrameQueue>();
    CallContext ctx;
    ctx.set_timeout(50ms);
    auto start = Clock::now();
    auto res = queue->pop(ctx);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Timeout));
    EXPECT_GE(Clock::now() - start, 40ms);
}

TEST(FrameQueue, CancelWakesBlockedReceiver)
{
    auto queue = std::make_shared<FrameQueue>();
    CancelSource source;
    CallContext ctx;
    ctx.cancel = source.token();

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });
    auto res = queue->pop(ctx);
    canceller.join();
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Cancelled));
}

TEST(FrameQueue, PushWakesBlockedReceiver)
{
    auto queue = std::make_shared<FrameQueue>();
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        queue->push(data_frame(9));
    });
    CallContext ctx;
    ctx.set_timeout(2s);
    auto res = queue->pop(ctx);
    producer.join();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res->payload.front(), 9);
}

TEST(CancelToken, CallbackRunsImmediatelyWhenAlreadyCancelled)
{
    CancelSource source;
    source.cancel();
    bool ran = false;
    auto registration = source.token().on_cancel([&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_TRUE(source.token().is_cancelled());
    EXPECT_FALSE(CancelToken{}.is_cancelled());
}

TEST(CancelToken, ResetRegistrationDoesNotRun)
{
    CancelSource source;
    bool ran = false;
    auto registration = source.token().on_cancel([&] { ran = true; });
    registration.reset();
    source.cancel();
    EXPECT_FALSE(ran);
}

TEST(Metadata, FindsFirstMatchingKey)
{
    Metadata metadata{{"tri-service-group", "blue"}, {"x", "1"}};
    EXPECT_EQ(find_metadata(metadata, "tri-service-group"), "blue");
    EXPECT_FALSE(find_metadata(metadata, "missing"));
}
