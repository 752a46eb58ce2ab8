#include <array>

#include <gtest/gtest.h>

#include "tcpros/cli/commands.hpp"

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const std::array<tcpros::cli::CommandSpec, 3> specs = {{
        {tcpros::cli::CommandId::Help, "help"},
        {tcpros::cli::CommandId::Decode, "decode"},
        {tcpros::cli::CommandId::Encode, "encode"},
    }};

    const char* argv[] = {"encode", "--topic", "/chatter", "-o", "hdr.bin"};
    const tcpros::cli::CliArgs args{argv, 5};

    tcpros::cli::CommandInvocation out{};
    tcpros::cli::u32 consumed = 0;
    const tcpros::core::Status s = tcpros::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, tcpros::cli::CommandId::Encode);
    ASSERT_EQ(out.args.argc, 4u);
    EXPECT_STREQ(out.args.argv[0], "--topic");
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const std::array<tcpros::cli::CommandSpec, 1> specs = {{{tcpros::cli::CommandId::Help, "help"}}};
    const char* argv[] = {"nope"};
    tcpros::cli::CommandInvocation out{};
    tcpros::cli::u32 consumed = 0;
    const tcpros::core::Status s = tcpros::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.domain, tcpros::core::StatusDomain::Cli);
    EXPECT_EQ(s.code, tcpros::core::StatusCode::NotFound);
    EXPECT_EQ(out.id, tcpros::cli::CommandId::None);
}

TEST(CliCommands, InvalidWhenFirstTokenIsAnOption) {
    const std::array<tcpros::cli::CommandSpec, 1> specs = {{{tcpros::cli::CommandId::Help, "help"}}};
    const char* argv[] = {"--help"};
    tcpros::cli::CommandInvocation out{};
    tcpros::cli::u32 consumed = 0;
    EXPECT_EQ(tcpros::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed).code,
              tcpros::core::StatusCode::Invalid);
    EXPECT_EQ(tcpros::cli::parse_command({argv, 0}, specs.data(), specs.size(), &out, &consumed).code,
              tcpros::core::StatusCode::Invalid);
}
