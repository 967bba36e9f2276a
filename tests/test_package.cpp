#include "triple/runtime/package.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace triple::runtime;

TEST(PackageHandler, PrefixesPayloadWithFlagAndBigEndianLength)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> payload{0xAA, 0xBB, 0xCC};
    auto frame = handler.to_frame_data(payload);
    ASSERT_TRUE(frame) << frame.error().message;
    std::vector<std::uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0x03, 0xAA, 0xBB, 0xCC};
    EXPECT_EQ(*frame, expected);

    auto body = handler.from_frame_data(*frame);
    ASSERT_TRUE(body) << body.error().message;
    EXPECT_EQ(*body, payload);
}

TEST(PackageHandler, EmptyPayloadIsAValidMessage)
{
    TriplePackageHandler handler;
    auto frame = handler.to_frame_data({});
    ASSERT_TRUE(frame);
    ASSERT_EQ(frame->size(), MessagePrefixSize);

    auto body = handler.from_frame_data(*frame);
    ASSERT_TRUE(body) << body.error().message;
    EXPECT_TRUE(body->empty());
}

TEST(PackageHandler, RejectsCompressedMessages)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> frame{0x01, 0x00, 0x00, 0x00, 0x01, 0x42};
    auto body = handler.from_frame_data(frame);
    ASSERT_FALSE(body);
    EXPECT_TRUE(body.error().is(ErrorCode::CodecError));
}

TEST(PackageHandler, RejectsLengthMismatchAndTruncatedPrefix)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> short_body{0x00, 0x00, 0x00, 0x00, 0x04, 0x01, 0x02};
    auto mismatch = handler.from_frame_data(short_body);
    ASSERT_FALSE(mismatch);
    EXPECT_TRUE(mismatch.error().is(ErrorCode::CodecError));

    std::vector<std::uint8_t> truncated{0x00, 0x00};
    auto prefix = handler.from_frame_data(truncated);
    ASSERT_FALSE(prefix);
    EXPECT_TRUE(prefix.error().is(ErrorCode::CodecError));
}

TEST(PackageHandler, FrameSizeWaitsForCompletePrefix)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> partial{0x00, 0x00, 0x00};
    auto incomplete = handler.frame_size(partial);
    ASSERT_TRUE(incomplete);
    EXPECT_FALSE(incomplete->has_value());

    std::vector<std::uint8_t> prefix{0x00, 0x00, 0x00, 0x01, 0x00};
    auto size = handler.frame_size(prefix);
    ASSERT_TRUE(size);
    ASSERT_TRUE(size->has_value());
    EXPECT_EQ(**size, MessagePrefixSize + 256);
}

TEST(PackageHandler, FrameSizeRejectsOversizedMessages)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> prefix{0x00, 0xFF, 0xFF, 0xFF, 0xFF};
    auto size = handler.frame_size(prefix);
    ASSERT_FALSE(size);
    EXPECT_TRUE(size.error().is(ErrorCode::ResourceExhausted));
}

TEST(PackageHandler, FramesPayloadAtTheSizeLimit)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> payload(MaxMessageSize, 0x5A);
    auto frame = handler.to_frame_data(payload);
    ASSERT_TRUE(frame) << frame.error().message;
    EXPECT_EQ(frame->size(), MessagePrefixSize + MaxMessageSize);

    auto body = handler.from_frame_data(*frame);
    ASSERT_TRUE(body) << body.error().message;
    EXPECT_EQ(body->size(), payload.size());
}

TEST(PackageHandler, RefusesToFramePayloadOverTheLimit)
{
    TriplePackageHandler handler;
    std::vector<std::uint8_t> payload(MaxMessageSize + 1);
    auto frame = handler.to_frame_data(payload);
    ASSERT_FALSE(frame);
    EXPECT_TRUE(frame.error().is(ErrorCode::ResourceExhausted));
    EXPECT_EQ(frame.error().message, "message of 67108865 bytes exceeds limit");
}
