#include "greeter.hpp"
#include "test_support.hpp"

#include "triple/runtime/client.hpp"
#include "triple/runtime/controller.hpp"
#include "triple/runtime/server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace triple::runtime;
using namespace std::chrono_literals;
using triple::test::CapturingLogger;

namespace
{

class RuntimeTest : public ::testing::Test
{
protected:
    void start_server(std::string serializer = "protobuf", std::shared_ptr<Executor> executor = nullptr)
    {
        option_.location = triple::test::unique_socket_address("rt");
        option_.serializer_type = std::move(serializer);
        option_.timeout = 2s;
        option_.logger = log_.logger();

        auto server = Server::create(option_, std::move(executor));
        ASSERT_TRUE(server) << server.error().message;
        server_ = std::move(*server);
        greeter::register_greeter(*server_);
    }

    void listen()
    {
        auto res = server_->listen();
        ASSERT_TRUE(res) << res.error().message;
    }

    std::unique_ptr<Client> connect(Option option)
    {
        auto client = Client::create(binding_, option);
        EXPECT_TRUE(client) << client.error().message;
        return client ? std::move(*client) : nullptr;
    }

    std::unique_ptr<Client> connect() { return connect(option_); }

    void TearDown() override
    {
        if (server_) {
            server_->stop();
            server_->join();
        }
    }

    static CallContext greeter_context()
    {
        auto ctx = CallContext::with_interface(std::string(greeter::InterfaceKey));
        ctx.set_timeout(5s);
        return ctx;
    }

    CapturingLogger log_;
    Option option_;
    greeter::GreeterBinding binding_;
    std::unique_ptr<Server> server_;
};

}  // namespace

TEST_F(RuntimeTest, UnaryCallReturnsReply)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"laurence"});
    ASSERT_TRUE(result.ok()) << result.error->message;
    ASSERT_NE(result.as<greeter::HelloReply>(), nullptr);
    EXPECT_EQ(result.as<greeter::HelloReply>()->message(), "Hello laurence");
}

TEST_F(RuntimeTest, SequentialCallsShareOneConnection)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    for (int i = 0; i < 10; ++i) {
        auto name = "caller" + std::to_string(i);
        auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{name});
        ASSERT_TRUE(result.ok()) << result.error->message;
        EXPECT_EQ(result.as<greeter::HelloReply>()->message(), "Hello " + name);
    }
    EXPECT_EQ(server_->connection_count(), 1u);
}

TEST_F(RuntimeTest, ConcurrentCallsAreMultiplexed)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    std::atomic<int> failures{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 8; ++t) {
        callers.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                auto name = std::to_string(t) + "-" + std::to_string(i);
                auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{name});
                if (!result.ok() || result.as<greeter::HelloReply>()->message() != "Hello " + name) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

TEST_F(RuntimeTest, BidirectionalStreamRepliesPerRequest)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto stream = client->stream(greeter_context(), "SayHelloStream");
    ASSERT_TRUE(stream) << stream.error().message;
    for (const char* name : {"alice", "bob"}) {
        ASSERT_TRUE((*stream)->send_message(greeter::HelloRequest{name}));
        greeter::HelloReply reply;
        auto res = (*stream)->receive_message(reply);
        ASSERT_TRUE(res) << res.error().message;
        EXPECT_EQ(reply.message(), std::string("Hello ") + name);
    }
    ASSERT_TRUE((*stream)->close_request());

    greeter::HelloReply last;
    auto end = (*stream)->receive_message(last);
    ASSERT_FALSE(end);
    EXPECT_TRUE(is_closed(end)) << end.error().message;
}

TEST_F(RuntimeTest, OpenStreamsEachHoldAWorkerOfTheSuppliedExecutor)
{
    auto executor = std::make_shared<ThreadPoolExecutor>(1, 4, log_.logger());
    start_server("protobuf", executor);
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto first = client->stream(greeter_context(), "SayHelloStream");
    auto second = client->stream(greeter_context(), "SayHelloStream");
    ASSERT_TRUE(first) << first.error().message;
    ASSERT_TRUE(second) << second.error().message;

    // The first handler is still blocked reading when the second stream needs a reply.
    for (auto* stream : {&*first, &*second}) {
        ASSERT_TRUE((*stream)->send_message(greeter::HelloRequest{"worker"}));
        greeter::HelloReply reply;
        auto res = (*stream)->receive_message(reply);
        ASSERT_TRUE(res) << res.error().message;
        EXPECT_EQ(reply.message(), "Hello worker");
    }
    EXPECT_GE(executor->worker_count(), 2u);

    ASSERT_TRUE((*first)->close_request());
    ASSERT_TRUE((*second)->close_request());
}

TEST_F(RuntimeTest, UnknownPathIsUnimplemented)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    greeter::HelloReply reply;
    auto res = client->request(greeter_context(), "/greet.Greeter/Missing", greeter::HelloRequest{"x"}, reply);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Unimplemented));
    EXPECT_NE(res.error().message.find("unknown method /greet.Greeter/Missing"), std::string::npos);
}

TEST_F(RuntimeTest, HandlerStatusReachesCaller)
{
    start_server();
    server_->register_handler("/greet.Greeter/Lookup", [](UserStream&) {
        return Status{GrpcStatus::NotFound, "no such user"};
    });
    server_->register_handler("/greet.Greeter/Throw", [](UserStream&) -> Status {
        throw std::runtime_error("handler blew up");
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    greeter::HelloReply reply;
    auto not_found = client->request(greeter_context(), "/greet.Greeter/Lookup", greeter::HelloRequest{"x"}, reply);
    ASSERT_FALSE(not_found);
    EXPECT_TRUE(not_found.error().is(ErrorCode::RemoteError));
    EXPECT_EQ(not_found.error().message, "NOT_FOUND: no such user");

    auto internal = client->request(greeter_context(), "/greet.Greeter/Throw", greeter::HelloRequest{"x"}, reply);
    ASSERT_FALSE(internal);
    EXPECT_EQ(internal.error().message, "INTERNAL: handler blew up");
}

TEST_F(RuntimeTest, FailingStatusAfterReplyFailsUnaryCall)
{
    start_server();
    server_->register_handler("/greet.Greeter/Late", [](UserStream& stream) {
        greeter::HelloRequest request;
        if (auto res = stream.receive_message(request); !res) {
            return to_status(res.error());
        }
        if (auto res = stream.send_message(greeter::HelloReply{"too early"}); !res) {
            return to_status(res.error());
        }
        return Status{GrpcStatus::Internal, "late failure"};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    greeter::HelloReply reply;
    auto res = client->request(greeter_context(), "/greet.Greeter/Late", greeter::HelloRequest{"x"}, reply);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::RemoteError)) << res.error().message;
    EXPECT_EQ(res.error().message, "INTERNAL: late failure");
    EXPECT_TRUE(reply.message().empty());

    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"after"});
    ASSERT_TRUE(result.ok()) << result.error->message;
}

TEST_F(RuntimeTest, UndecodableStreamMessageIsLogged)
{
    start_server();
    server_->register_handler("/greet.Greeter/Garbled", [](UserStream& stream) {
        // A length-delimited field that claims more bytes than follow.
        TriplePackageHandler package;
        auto data = package.to_frame_data(std::vector<std::uint8_t>{0x0A, 0x05, 'a'});
        if (!data) {
            return to_status(data.error());
        }
        if (auto res = stream.stream()->send(Frame{FrameType::Data, std::move(*data)}); !res) {
            return to_status(res.error());
        }
        return Status{};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto stream = client->request_stream(greeter_context(), "/greet.Greeter/Garbled");
    ASSERT_TRUE(stream) << stream.error().message;
    ASSERT_TRUE((*stream)->close_request());

    greeter::HelloReply reply;
    auto res = (*stream)->receive_message(reply);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::CodecError)) << res.error().message;
    EXPECT_EQ(log_.count("/greet.Greeter/Garbled: cannot decode message"), 1u) << log_.text();
}

TEST_F(RuntimeTest, ClosingClientWakesBlockedReceive)
{
    start_server();
    server_->register_handler("/greet.Greeter/Silent", [](UserStream& stream) {
        greeter::HelloRequest request;
        while (stream.receive_message(request)) {
        }
        return Status{};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto ctx = greeter_context();
    ctx.set_timeout(30s);
    auto stream = client->request_stream(ctx, "/greet.Greeter/Silent");
    ASSERT_TRUE(stream) << stream.error().message;
    ASSERT_TRUE((*stream)->send_message(greeter::HelloRequest{"anyone"}));

    std::promise<Result<void>> received;
    auto future = received.get_future();
    std::thread reader([&received, s = *stream] {
        greeter::HelloReply reply;
        received.set_value(s->receive_message(reply));
    });

    EXPECT_EQ(future.wait_for(100ms), std::future_status::timeout);
    client->close();
    auto ready = future.wait_for(2s);
    reader.join();
    ASSERT_EQ(ready, std::future_status::ready);

    auto res = future.get();
    ASSERT_FALSE(res);
    EXPECT_TRUE(is_closed(res) || res.error().is(ErrorCode::Unavailable)) << res.error().message;
}

TEST_F(RuntimeTest, CallFailsAtDeadline)
{
    start_server();
    server_->register_handler("/greet.Greeter/Slow", [](UserStream&) {
        std::this_thread::sleep_for(300ms);
        return Status{};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto ctx = CallContext::with_interface(std::string(greeter::InterfaceKey));
    ctx.set_timeout(50ms);
    greeter::HelloReply reply;
    auto res = client->request(ctx, "/greet.Greeter/Slow", greeter::HelloRequest{"x"}, reply);
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Timeout)) << res.error().message;

    // The connection survives a timed out call.
    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"again"});
    EXPECT_TRUE(result.ok());
}

TEST_F(RuntimeTest, CancelledCallReturnsCancelled)
{
    start_server();
    server_->register_handler("/greet.Greeter/Slow", [](UserStream&) {
        std::this_thread::sleep_for(300ms);
        return Status{};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    CancelSource source;
    auto ctx = greeter_context();
    ctx.cancel = source.token();
    std::thread canceller([&] {
        std::this_thread::sleep_for(30ms);
        source.cancel();
    });
    greeter::HelloReply reply;
    auto res = client->request(ctx, "/greet.Greeter/Slow", greeter::HelloRequest{"x"}, reply);
    canceller.join();
    ASSERT_FALSE(res);
    EXPECT_TRUE(res.error().is(ErrorCode::Cancelled)) << res.error().message;
}

TEST_F(RuntimeTest, ConcurrentCloseDestroysOnce)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(client->is_available());

    std::vector<std::thread> closers;
    for (int i = 0; i < 8; ++i) {
        closers.emplace_back([&] { client->close(); });
    }
    for (auto& closer : closers) {
        closer.join();
    }
    EXPECT_FALSE(client->is_available());

    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"late"});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.error->is(ErrorCode::Unavailable));

    client.reset();
    EXPECT_EQ(log_.count("destroyed"), 1u);
}

TEST_F(RuntimeTest, MethodTableErrors)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto unknown = client->invoke(greeter_context(), "SayGoodbye", greeter::HelloRequest{"x"});
    ASSERT_FALSE(unknown.ok());
    EXPECT_TRUE(unknown.error->is(ErrorCode::DispatchError));
    EXPECT_NE(unknown.reply, nullptr);

    auto streaming = client->invoke(greeter_context(), "SayHelloStream", greeter::HelloRequest{"x"});
    ASSERT_FALSE(streaming.ok());
    EXPECT_TRUE(streaming.error->is(ErrorCode::DispatchError));

    auto unary_as_stream = client->stream(greeter_context(), "SayHello");
    ASSERT_FALSE(unary_as_stream);
    EXPECT_TRUE(unary_as_stream.error().is(ErrorCode::DispatchError));
}

TEST_F(RuntimeTest, HessianInvokeByMethodName)
{
    start_server("hessian2");
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"laurence"});
    ASSERT_TRUE(result.ok()) << result.error->message;
    const auto* value = result.as<ValueMessage>();
    ASSERT_NE(value, nullptr);
    const auto* object = boost::get<hessian::Object>(&value->value());
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(object->class_name, "greet.HelloReply");
    ASSERT_NE(object->field("message"), nullptr);
    EXPECT_EQ(boost::get<std::string>(*object->field("message")), "Hello laurence");

    greeter::HelloReply typed;
    ASSERT_TRUE(typed.from_hessian(value->value()));
    EXPECT_EQ(typed.message(), "Hello laurence");
}

TEST_F(RuntimeTest, HessianMalformedReplyIsCodecError)
{
    start_server("hessian2");
    server_->register_handler("/greet.Greeter/Broken", [](UserStream& stream) {
        TriplePackageHandler package;
        std::vector<std::uint8_t> garbage{0xFF, 0xFF, 0xFF};
        auto data = package.to_frame_data(garbage);
        if (!data) {
            return to_status(data.error());
        }
        if (auto res = stream.stream()->send(Frame{FrameType::Data, std::move(*data)}); !res) {
            return to_status(res.error());
        }
        return Status{};
    });
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto result = client->invoke(greeter_context(), "Broken", ArgumentsMessage{});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.error->is(ErrorCode::CodecError)) << result.error->message;
    EXPECT_NE(result.as<ValueMessage>(), nullptr);
}

TEST_F(RuntimeTest, UnknownSerializerMakesNoCall)
{
    start_server();
    std::atomic<int> calls{0};
    server_->set_default_handler([&calls](UserStream&) {
        calls.fetch_add(1);
        return Status{};
    });
    listen();

    Option option = option_;
    option.serializer_type = "json";
    auto client = connect(option);
    ASSERT_NE(client, nullptr);

    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"x"});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.error->is(ErrorCode::ConfigError));
    EXPECT_EQ(calls.load(), 0);
    EXPECT_GE(log_.count("unsupported serializer type 'json'"), 1u);
}

TEST_F(RuntimeTest, ServerRejectsUnknownSerializer)
{
    Option option;
    option.serializer_type = "json";
    option.logger = log_.logger();
    auto server = Server::create(option);
    ASSERT_FALSE(server);
    EXPECT_TRUE(server.error().is(ErrorCode::ConfigError));
}

TEST_F(RuntimeTest, ConnectFailureIsReported)
{
    Option option;
    option.location = triple::test::unique_socket_address("nobody");
    option.timeout = 200ms;
    option.logger = log_.logger();
    auto client = Client::create(binding_, option);
    ASSERT_FALSE(client);
    EXPECT_TRUE(client.error().is(ErrorCode::ConnectionError)) << client.error().message;
}

TEST_F(RuntimeTest, ServesAnInProcessSocketPair)
{
    start_server();
    auto pair = net::socket_pair();
    ASSERT_TRUE(pair) << pair.error().message;
    std::thread accept([&] { ASSERT_TRUE(server_->serve(pair->first)); });

    auto client = Client::create(binding_, pair->second, option_);
    accept.join();
    ASSERT_TRUE(client) << client.error().message;

    auto result = (*client)->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"pair"});
    ASSERT_TRUE(result.ok()) << result.error->message;
    EXPECT_EQ(result.as<greeter::HelloReply>()->message(), "Hello pair");
}

TEST_F(RuntimeTest, RequestHeadersCarryServiceMetadata)
{
    start_server();
    std::string group;
    std::string version;
    std::string content_type;
    server_->register_handler("/greet.Greeter/Headers", [&](UserStream& stream) {
        const auto& headers = stream.stream()->headers();
        group = find_metadata(headers, "tri-service-group").value_or("");
        version = find_metadata(headers, "tri-service-version").value_or("");
        content_type = find_metadata(headers, "content-type").value_or("");
        return Status{};
    });
    listen();

    Option option = option_;
    option.header_group = "blue";
    option.header_app_version = "1.0.0";
    auto client = connect(option);
    ASSERT_NE(client, nullptr);

    auto stream = client->request_stream(greeter_context(), "/greet.Greeter/Headers");
    ASSERT_TRUE(stream) << stream.error().message;
    ASSERT_TRUE((*stream)->close_request());
    greeter::HelloReply reply;
    auto end = (*stream)->receive_message(reply);
    ASSERT_FALSE(end);
    EXPECT_TRUE(end.error().is(ErrorCode::StreamClosed));

    EXPECT_EQ(group, "blue");
    EXPECT_EQ(version, "1.0.0");
    EXPECT_EQ(content_type, "application/grpc+proto");
}

TEST_F(RuntimeTest, MetadataCallsFollowStreamRole)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);

    auto stream = client->stream(greeter_context(), "SayHelloStream");
    ASSERT_TRUE(stream) << stream.error().message;
    auto& user = **stream;
    EXPECT_TRUE(user.close_send());
    auto header = user.header();
    ASSERT_TRUE(header);
    EXPECT_TRUE(header->empty());

    auto set_header = user.set_header({{"k", "v"}});
    ASSERT_FALSE(set_header);
    EXPECT_TRUE(set_header.error().is(ErrorCode::Unimplemented));
    auto finish = user.finish(Status{});
    ASSERT_FALSE(finish);
    EXPECT_TRUE(finish.error().is(ErrorCode::Unimplemented));

    user.cancel();
}

TEST_F(RuntimeTest, ServerStopMakesClientUnavailable)
{
    start_server();
    listen();
    auto client = connect();
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"x"}).ok());

    server_->stop();
    server_->join();

    auto deadline = Clock::now() + 2s;
    while (client->is_available() && Clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(client->is_available());
    auto result = client->invoke(greeter_context(), "SayHello", greeter::HelloRequest{"x"});
    EXPECT_FALSE(result.ok());
}

TEST(Controller, OpenRejectsMalformedAddress)
{
    CapturingLogger log;
    Option option;
    option.logger = log.logger();
    auto controller = Controller::open("not-an-address", option);
    ASSERT_FALSE(controller);
    EXPECT_TRUE(controller.error().is(ErrorCode::ConfigError));
    EXPECT_EQ(log.count("invalid address 'not-an-address'"), 1u);
}
