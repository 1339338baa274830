#include <benchmark/benchmark.h>
#include "linerpc/builtins.hpp"
#include "linerpc/dispatcher.hpp"
#include "linerpc/event_loop.hpp"
#include "linerpc/registry.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace linerpc;

namespace {

// Discards everything written; used to time the full line pipeline.
class NullTransport : public ITransport {
public:
    std::optional<std::string> read_line() override { return std::nullopt; }
    void write_line(std::string_view) override {}
    void close() override {}
};

} // namespace

// Create a registry with N methods registered
static std::unique_ptr<HandlerRegistry> make_registry(int n_methods) {
    auto registry = std::make_unique<HandlerRegistry>();
    for (int i = 0; i < n_methods; ++i) {
        registry->register_handler("method_" + std::to_string(i),
            [](const json&, const std::optional<RequestId>&) -> HandlerResult {
                return json{{"result", "ok"}};
            });
    }
    registry->register_handler("ping", [](const json&, const std::optional<RequestId>&) -> HandlerResult {
        return json::object();
    });
    return registry;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";
    JsonRpcMessage msg{req};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";
    JsonRpcMessage msg{req};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto registry = make_registry(100);
    Dispatcher dispatcher(*registry);

    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < 100; ++i) {
        JsonRpcRequest req;
        req.id = RequestId{int64_t{i}};
        req.method = "method_" + std::to_string(i);
        requests.emplace_back(req);
    }

    int i = 0;
    for (auto _ : state) {
        auto resp = dispatcher.dispatch(requests[i % 100]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    HandlerRegistry registry;
    registry.register_handler("notifications/initialized",
        [](const json&, const std::optional<RequestId>&) -> HandlerResult { return json(); });
    Dispatcher dispatcher(registry);

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    JsonRpcMessage msg{notif};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

static void BM_HandlePingLine(benchmark::State& state) {
    Session session;
    HandlerRegistry registry;
    register_builtin_handlers(registry, ServerInfo{"bench", "1.0", "1.0.0"}, session);
    NullTransport transport;
    EventLoop loop(registry, transport);

    const std::string line = R"({"jsonrpc":"2.0","method":"ping","params":{"data":"hello"},"id":1})";
    for (auto _ : state) {
        auto resp = loop.handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandlePingLine)->MinTime(1.0);
