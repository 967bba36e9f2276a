#include "test_support.hpp"

#include "triple/runtime/option.hpp"
#include "triple/runtime/serialization/hessian.hpp"
#include "triple/runtime/serialization/wrapper.hpp"
#include "triple/runtime/serializer.hpp"

#include <gtest/gtest.h>

using namespace triple::runtime;
using triple::test::TextMessage;

TEST(Wrapper, RequestCarriesArgumentsAndTypes)
{
    wrapper::RequestWrapper request;
    request.serialize_type = "hessian2";
    request.args = {{0x90}, {0x05, 'h', 'e', 'l', 'l', 'o'}};
    request.arg_types = {"int", "java.lang.String"};

    auto bytes = wrapper::encode(request);
    ASSERT_TRUE(bytes) << bytes.error().message;
    auto decoded = wrapper::decode_request(*bytes);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->serialize_type, "hessian2");
    EXPECT_EQ(decoded->args, request.args);
    EXPECT_EQ(decoded->arg_types, request.arg_types);
}

TEST(Wrapper, RequestRejectsMismatchedTypeCount)
{
    wrapper::RequestWrapper request;
    request.args = {{0x90}};
    auto bytes = wrapper::encode(request);
    ASSERT_FALSE(bytes);
    EXPECT_TRUE(bytes.error().is(ErrorCode::CodecError));
}

TEST(Serializer, MakeSerializerByName)
{
    auto pb = make_serializer(ProtobufSerializerName);
    ASSERT_TRUE(pb);
    EXPECT_EQ((*pb)->type(), "protobuf");

    auto hessian = make_serializer(HessianSerializerName);
    ASSERT_TRUE(hessian);
    EXPECT_EQ((*hessian)->type(), "hessian2");

    auto unknown = make_serializer("json");
    ASSERT_FALSE(unknown);
    EXPECT_TRUE(unknown.error().is(ErrorCode::ConfigError));
}

TEST(Serializer, ProtobufUsesMessageEncoding)
{
    ProtobufSerializer serializer;
    auto bytes = serializer.marshal_request(TextMessage{"hi"});
    ASSERT_TRUE(bytes) << bytes.error().message;
    EXPECT_EQ(*bytes, (std::vector<std::uint8_t>{0x0A, 0x02, 'h', 'i'}));

    TextMessage out;
    ASSERT_TRUE(serializer.unmarshal_response(*bytes, out));
    EXPECT_EQ(out.value(), "hi");
}

TEST(Serializer, HessianWrapsRequestArguments)
{
    HessianWrapperSerializer serializer;
    ArgumentsMessage arguments({hessian::Value{std::string("world")}, hessian::Value{std::int32_t{3}}});
    auto bytes = serializer.marshal_request(arguments);
    ASSERT_TRUE(bytes) << bytes.error().message;

    auto wrapped = wrapper::decode_request(*bytes);
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(wrapped->serialize_type, "hessian2");
    ASSERT_EQ(wrapped->args.size(), 2u);
    EXPECT_EQ(wrapped->arg_types, (std::vector<std::string>{"java.lang.String", "int"}));

    ArgumentsMessage received;
    ASSERT_TRUE(serializer.unmarshal_request(*bytes, received));
    ASSERT_EQ(received.arguments().size(), 2u);
    EXPECT_EQ(boost::get<std::string>(received.arguments()[0]), "world");
    EXPECT_EQ(boost::get<std::int32_t>(received.arguments()[1]), 3);
}

TEST(Serializer, HessianSingleArgumentMessage)
{
    HessianWrapperSerializer serializer;
    auto bytes = serializer.marshal_request(TextMessage{"alice"});
    ASSERT_TRUE(bytes) << bytes.error().message;

    TextMessage received;
    ASSERT_TRUE(serializer.unmarshal_request(*bytes, received));
    EXPECT_EQ(received.value(), "alice");

    ArgumentsMessage two({hessian::Value{std::string("a")}, hessian::Value{std::string("b")}});
    auto pair = serializer.marshal_request(two);
    ASSERT_TRUE(pair);
    auto mismatch = serializer.unmarshal_request(*pair, received);
    ASSERT_FALSE(mismatch);
    EXPECT_TRUE(mismatch.error().is(ErrorCode::CodecError));
}

TEST(Serializer, HessianResponseRoundTripsThroughWrapper)
{
    HessianWrapperSerializer serializer;
    auto bytes = serializer.marshal_response(TextMessage{"Hello laurence"});
    ASSERT_TRUE(bytes) << bytes.error().message;

    auto wrapped = wrapper::decode_response(*bytes);
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(wrapped->type, "java.lang.String");

    ValueMessage reply;
    ASSERT_TRUE(serializer.unmarshal_response(*bytes, reply));
    EXPECT_EQ(boost::get<std::string>(reply.value()), "Hello laurence");
}

TEST(Serializer, HessianRejectsForeignOrEmptyResponse)
{
    HessianWrapperSerializer serializer;
    ValueMessage reply;

    wrapper::ResponseWrapper foreign;
    foreign.serialize_type = "fastjson";
    foreign.data = {0x90};
    auto foreign_bytes = wrapper::encode(foreign);
    ASSERT_TRUE(foreign_bytes);
    auto res = serializer.unmarshal_response(*foreign_bytes, reply);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::CodecError));

    wrapper::ResponseWrapper empty;
    empty.serialize_type = "hessian2";
    auto empty_bytes = wrapper::encode(empty);
    ASSERT_TRUE(empty_bytes);
    EXPECT_FALSE(serializer.unmarshal_response(*empty_bytes, reply));
}

TEST(Serializer, MessageWithoutCodecSupportIsUnimplemented)
{
    ProtobufSerializer serializer;
    ValueMessage value;
    auto bytes = serializer.marshal_request(value);
    ASSERT_FALSE(bytes);
    EXPECT_TRUE(bytes.error().is(ErrorCode::Unimplemented));
}
