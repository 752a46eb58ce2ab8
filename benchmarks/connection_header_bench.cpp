#include <cstdint>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "tcpros/net/connection_header.hpp"

static tcpros::net::ConnectionHeader make_header(size_t definition_bytes) {
    tcpros::net::ConnectionHeader h{};
    h.caller_id = "/rostopic_4767_1316912741557";
    h.latching = true;
    h.msg_definition = std::string(definition_bytes, 'd');
    h.md5sum = "992ce8a1687cec8c8bd883ec73ca41d1";
    h.topic = "/chatter";
    h.topic_type = "std_msgs/String";
    h.tcp_nodelay = true;
    return h;
}

static void BM_HeaderEncode(benchmark::State& state){
    const tcpros::net::ConnectionHeader h = make_header(static_cast<size_t>(state.range(0)));
    std::vector<tcpros::net::u8> buf(tcpros::net::header_encoded_size(h, true));

    for (auto _ : state){
        const tcpros::net::u32 written =
            tcpros::net::header_encode(h, true, {buf.data(), static_cast<tcpros::net::u32>(buf.size())});
        benchmark::DoNotOptimize(written);
        benchmark::ClobberMemory();
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(buf.size()));
}
BENCHMARK(BM_HeaderEncode)->Arg(0)->Arg(16)->Arg(256)->Arg(4096);

static void BM_HeaderDecode(benchmark::State& state){
    const std::vector<tcpros::net::u8> bytes =
        tcpros::net::header_encode(make_header(static_cast<size_t>(state.range(0))), true);

    for (auto _ : state){
        tcpros::net::ConnectionHeader out{};
        const tcpros::core::Status s =
            tcpros::net::header_decode({bytes.data(), static_cast<tcpros::net::u32>(bytes.size())}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_HeaderDecode)->Arg(0)->Arg(16)->Arg(256)->Arg(4096);
