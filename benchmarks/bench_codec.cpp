#include <benchmark/benchmark.h>
#include "linerpc/codec.hpp"
#include "linerpc/json_rpc.hpp"
#include <string>

using namespace linerpc;

// Small message (~60 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"weather/get","params":{"location":"Warsaw","units":"celsius"}})";

// Generate a request whose params hold N records
static std::string make_large_request(int n) {
    json records = json::array();
    for (int i = 0; i < n; ++i) {
        records.push_back({
            {"name", "record_" + std::to_string(i)},
            {"description", "A record carrying something useful, number " + std::to_string(i)},
            {"fields", {
                {"param1", {{"type", "string"}, {"value", "first"}}},
                {"param2", {{"type", "integer"}, {"value", i}}}
            }}
        });
    }
    json req = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "records/import"},
        {"params", {{"records", records}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(100);

// ---- Decode benchmarks ----

static void BM_DecodeSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_DecodeSmallMessage)->MinTime(1.0);

static void BM_DecodeCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCallRequest.size());
}
BENCHMARK(BM_DecodeCallRequest)->MinTime(1.0);

static void BM_DecodeLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kLargeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_DecodeLargeRequest)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string garbage = "{\"jsonrpc\":\"2.0\",\"id\":1,";
    for (auto _ : state) {
        auto msg = Codec::decode(garbage);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, json{{"message", "pong"}});
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeLargeResponse(benchmark::State& state) {
    auto req = std::get<JsonRpcRequest>(Codec::decode(kLargeRequest));
    auto resp = JsonRpcResponse::success(req.id, req.params);
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_SerializeLargeResponse)->MinTime(1.0);
