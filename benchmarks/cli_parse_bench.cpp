#include <array>

#include <benchmark/benchmark.h>

#include "tcpros/cli/commands.hpp"
#include "tcpros/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<tcpros::cli::OptionSpec, 4> specs = {{
        {tcpros::cli::OptionId::Topic, tcpros::cli::OptionType::String, "topic", 't'},
        {tcpros::cli::OptionId::Output, tcpros::cli::OptionType::String, "output", 'o'},
        {tcpros::cli::OptionId::Type, tcpros::cli::OptionType::String, "type", 'y'},
        {tcpros::cli::OptionId::Latching, tcpros::cli::OptionType::Flag, "latching", 'l'},
    }};

    const char* argv[] = {"--latching", "--topic", "/chatter", "--type=std_msgs/String", "-ohdr.bin", "--", "x"};
    const tcpros::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        tcpros::cli::ParsedOption buf[8]{};
        tcpros::cli::ParsedOptions out{buf, 0, 8};
        tcpros::cli::u32 consumed = 0;
        const tcpros::core::Status s = tcpros::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<tcpros::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<tcpros::cli::CommandSpec, 4> specs = {{
        {tcpros::cli::CommandId::Help, "help"},
        {tcpros::cli::CommandId::Decode, "decode"},
        {tcpros::cli::CommandId::Encode, "encode"},
        {tcpros::cli::CommandId::Find, "find"},
    }};

    const char* argv[] = {"encode", "--topic", "/chatter", "-o", "hdr.bin"};
    const tcpros::cli::CliArgs args{argv, 5};
    for (auto _ : state) {
        tcpros::cli::CommandInvocation out{};
        tcpros::cli::u32 consumed = 0;
        const tcpros::core::Status s = tcpros::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<tcpros::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<tcpros::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
