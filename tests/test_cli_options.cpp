#include <gtest/gtest.h>

#include "cli/options.hpp"

using namespace std::chrono_literals;

TEST(CliOptions, ParseHelpOption)
{
    int argc = 2;
    char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("--help")};
    auto opts = triple::parse_command_line(argc, argv);
    ASSERT_TRUE(opts);
    ASSERT_TRUE(opts->help_message.has_value());

    const auto& help = opts->help_message.value();
    EXPECT_EQ(help.rfind("Usage: tri <Options>:\nOptions:\n", 0), 0u);
    for (const char* option : {"--help", "--address", "--serializer", "--timeout", "--buffer-size", "--group",
                               "--app-version", "--interface", "--method", "--request", "--serve", "--verbose"}) {
        EXPECT_NE(help.find(option), std::string::npos) << option;
    }
}

TEST(CliOptions, HelpIgnoresMissingCallOptions)
{
    int argc = 3;
    char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("-h"), const_cast<char*>("--serve")};
    auto opts = triple::parse_command_line(argc, argv);
    ASSERT_TRUE(opts);
    EXPECT_TRUE(opts->help_message.has_value());
}

TEST(CliOptions, CallRequiresInterfaceAndMethod)
{
    {
        int argc = 1;
        char* argv[] = {const_cast<char*>("tri")};
        auto opts = triple::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_EQ(opts.error(), "the option '--interface' is required for a call");
    }

    {
        int argc = 3;
        char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("-i"), const_cast<char*>("greet.Greeter")};
        auto opts = triple::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_EQ(opts.error(), "the option '--method' is required for a call");
    }

    {
        // error case - option is provided without value
        int argc = 2;
        char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("--interface")};
        auto opts = triple::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_EQ(opts.error(), "the required argument for option '--interface' is missing");
    }
}

TEST(CliOptions, CallDefaults)
{
    int argc = 5;
    char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("-i"), const_cast<char*>("greet.Greeter"),
                    const_cast<char*>("-m"), const_cast<char*>("SayHello")};
    auto opts = triple::parse_command_line(argc, argv);
    ASSERT_TRUE(opts) << opts.error();
    EXPECT_EQ(opts->address, "127.0.0.1:20001");
    EXPECT_EQ(opts->serializer, "hessian2");
    EXPECT_EQ(opts->timeout, 0ms);
    EXPECT_EQ(opts->buffer_size, 0u);
    EXPECT_EQ(opts->interface_key, "greet.Greeter");
    EXPECT_EQ(opts->method, "SayHello");
    EXPECT_EQ(opts->request, "[]");
    EXPECT_TRUE(opts->group.empty());
    EXPECT_FALSE(opts->serve);
    EXPECT_FALSE(opts->verbose);
    EXPECT_FALSE(opts->help_message.has_value());
}

TEST(CliOptions, ParseAllCallOptions)
{
    int argc = 18;
    char* argv[] = {const_cast<char*>("tri"),
                    const_cast<char*>("--address"),
                    const_cast<char*>("unix:/tmp/tri.sock"),
                    const_cast<char*>("-s"),
                    const_cast<char*>("protobuf"),
                    const_cast<char*>("-t"),
                    const_cast<char*>("500"),
                    const_cast<char*>("--buffer-size=8192"),
                    const_cast<char*>("--group"),
                    const_cast<char*>("blue"),
                    const_cast<char*>("--app-version"),
                    const_cast<char*>("2.0.0"),
                    const_cast<char*>("--interface=greet.Greeter"),
                    const_cast<char*>("--method=SayHello"),
                    const_cast<char*>("-r"),
                    const_cast<char*>("{\"name\":\"x\"}"),
                    const_cast<char*>("-v"),
                    const_cast<char*>("--serve")};
    auto opts = triple::parse_command_line(argc, argv);
    ASSERT_TRUE(opts) << opts.error();
    EXPECT_EQ(opts->address, "unix:/tmp/tri.sock");
    EXPECT_EQ(opts->serializer, "protobuf");
    EXPECT_EQ(opts->timeout, 500ms);
    EXPECT_EQ(opts->buffer_size, 8192u);
    EXPECT_EQ(opts->group, "blue");
    EXPECT_EQ(opts->app_version, "2.0.0");
    EXPECT_EQ(opts->interface_key, "greet.Greeter");
    EXPECT_EQ(opts->method, "SayHello");
    EXPECT_EQ(opts->request, "{\"name\":\"x\"}");
    EXPECT_TRUE(opts->verbose);
    EXPECT_TRUE(opts->serve);
}

TEST(CliOptions, ServeNeedsNoCallOptions)
{
    int argc = 4;
    char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("--serve"), const_cast<char*>("-a"),
                    const_cast<char*>("0.0.0.0:20001")};
    auto opts = triple::parse_command_line(argc, argv);
    ASSERT_TRUE(opts) << opts.error();
    EXPECT_TRUE(opts->serve);
    EXPECT_EQ(opts->address, "0.0.0.0:20001");
}

TEST(CliOptions, RejectsUnknownOptionAndBadNumber)
{
    {
        int argc = 2;
        char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("--bogus")};
        auto opts = triple::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_EQ(opts.error(), "unrecognised option '--bogus'");
    }

    {
        int argc = 3;
        char* argv[] = {const_cast<char*>("tri"), const_cast<char*>("--timeout"), const_cast<char*>("soon")};
        auto opts = triple::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_NE(opts.error().find("timeout"), std::string::npos);
    }
}
