#include <spanner/core/core.hpp>

#include <spanner/io/snapshot.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

using namespace spanner::core;

namespace {

Event make_event(int64_t i) {
    Level level = (i % 10 == 0) ? Level::Error : Level::Info;
    Event event(EventData("message " + std::to_string(i), level, (i % 2 == 0) ? "app::db" : "app::http"));
    event.add_metadata("index", std::to_string(i));
    return event;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_EmitFanOut: one emit delivered to N subscribers
// ---------------------------------------------------------------------------

static void BM_EmitFanOut(benchmark::State& state) {
    EventTarget<Event> target;
    std::vector<SubscriptionId> ids;
    int64_t delivered = 0;
    for (int64_t i = 0; i < state.range(0); ++i) {
        ids.push_back(target.subscribe([&delivered](const EventTarget<Event>::Value&) { ++delivered; }));
    }
    auto event = std::make_shared<const Event>(make_event(0));

    for (auto _ : state) {
        target.emit(event);
    }
    benchmark::DoNotOptimize(delivered);
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EmitFanOut)->Arg(1)->Arg(8)->Arg(64);

// ---------------------------------------------------------------------------
// BM_StoreEmit: emit into a full store (steady-state eviction)
// ---------------------------------------------------------------------------

static void BM_StoreEmit(benchmark::State& state) {
    EventManager manager(static_cast<std::size_t>(state.range(0)));
    for (int64_t i = 0; i < state.range(0); ++i) {
        manager.push(make_event(i));
    }
    auto event = std::make_shared<const Event>(make_event(1));

    for (auto _ : state) {
        manager.emit(event);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StoreEmit)->Arg(1000)->Arg(12000);

// ---------------------------------------------------------------------------
// BM_Search: conjunctive search over a full store
// ---------------------------------------------------------------------------

static void BM_Search(benchmark::State& state) {
    EventManager manager;
    for (int64_t i = 0; i < static_cast<int64_t>(manager.max_events()); ++i) {
        manager.push(make_event(i));
    }
    SearchCriteria criteria;
    criteria.level = Level::Error;
    criteria.target = "db";
    criteria.message = "message 1";

    for (auto _ : state) {
        auto result = manager.search(criteria);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Search);

// ---------------------------------------------------------------------------
// BM_CaptureInSpans: capture with a three-deep span stack
// ---------------------------------------------------------------------------

static void BM_CaptureInSpans(benchmark::State& state) {
    Registry registry;
    registry.init_event_manager();

    SpanGuard outer("request", Level::Info, "bench");
    SpanGuard middle("handler", Level::Info, "bench");
    SpanGuard inner("query", Level::Debug, "bench");

    for (auto _ : state) {
        auto event = capture_event(registry, "captured", Level::Info, "bench");
        benchmark::DoNotOptimize(event);
    }
}
BENCHMARK(BM_CaptureInSpans);

// ---------------------------------------------------------------------------
// BM_EncodeSnapshot: serialize N events
// ---------------------------------------------------------------------------

static void BM_EncodeSnapshot(benchmark::State& state) {
    std::vector<Event> events;
    for (int64_t i = 0; i < state.range(0); ++i) {
        events.push_back(make_event(i));
    }
    auto data = spanner::io::create_export_data(std::move(events));

    for (auto _ : state) {
        auto json = spanner::io::encode_snapshot(data);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_EncodeSnapshot)->Arg(100)->Arg(1000);
