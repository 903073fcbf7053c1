#include <spanner/core/event_manager.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace spanner::core;

namespace {

Event make_event(std::string message, Level level = Level::Info, std::string target = "app") {
    return Event(EventData(std::move(message), level, std::move(target)));
}

std::vector<std::string> messages(const EventManager::EventList& events) {
    std::vector<std::string> result;
    for (const auto& event : events) {
        result.push_back(event->data().message());
    }
    return result;
}

} // anonymous namespace

class EventManagerTest : public ::testing::Test {
protected:
    EventManager manager;
};

// =============================================================================
// Storage
// =============================================================================

TEST_F(EventManagerTest, DefaultCapacity) {
    EXPECT_EQ(manager.max_events(), EventManager::DEFAULT_MAX_EVENTS);
    EXPECT_EQ(manager.max_events(), 12'000u);
    EXPECT_TRUE(manager.empty());
}

TEST_F(EventManagerTest, PushPrependsNewestFirst) {
    manager.push(make_event("a"));
    manager.push(make_event("b"));
    manager.push(make_event("c"));

    EXPECT_EQ(manager.size(), 3u);
    EXPECT_EQ(messages(manager.snapshot()), (std::vector<std::string>{"c", "b", "a"}));
}

TEST(EventManagerCapacityTest, EvictsOldestBeyondCapacity) {
    EventManager manager(2);
    manager.push(make_event("A"));
    manager.push(make_event("B"));
    manager.push(make_event("C"));

    EXPECT_EQ(messages(manager.snapshot()), (std::vector<std::string>{"C", "B"}));
}

TEST(EventManagerCapacityTest, LengthNeverExceedsCapacity) {
    EventManager manager(5);
    for (int i = 0; i < 20; ++i) {
        manager.push(make_event(std::to_string(i)));
        EXPECT_LE(manager.size(), 5u);
        EXPECT_EQ(manager.snapshot().front()->data().message(), std::to_string(i));
    }
    EXPECT_EQ(messages(manager.snapshot()), (std::vector<std::string>{"19", "18", "17", "16", "15"}));
}

TEST(EventManagerCapacityTest, ZeroCapacityRetainsNothing) {
    EventManager manager(0);
    manager.push(make_event("dropped"));
    EXPECT_TRUE(manager.empty());
}

TEST_F(EventManagerTest, ClearKeepsSubscriptions) {
    int seen = 0;
    auto id = manager.events().subscribe([&seen](const EventManager::EventPtr&) { ++seen; });

    manager.emit(make_event("one"));
    auto before = manager.snapshot();
    manager.clear();

    EXPECT_TRUE(manager.empty());
    EXPECT_EQ(before.size(), 1u);

    manager.emit(make_event("two"));
    EXPECT_EQ(seen, 2);
    EXPECT_EQ(manager.size(), 1u);
    manager.events().unsubscribe(id);
}

TEST(EventManagerCapacityTest, LongParentChainIsReleased) {
    constexpr int kChainLength = 300'000;
    EventManager manager(10);

    std::shared_ptr<const Event> prev;
    for (int i = 0; i < kChainLength; ++i) {
        Event event = make_event(std::to_string(i));
        event.with_parent(prev);
        prev = std::make_shared<const Event>(std::move(event));
        manager.push(prev);
    }
    EXPECT_EQ(manager.size(), 10u);

    // Eviction released earlier copies; the store now holds the only
    // references to the chain
    prev.reset();
    EXPECT_EQ(manager.snapshot().front()->data().message(), std::to_string(kChainLength - 1));
    manager.clear();
    EXPECT_TRUE(manager.empty());
}

// =============================================================================
// Bus integration
// =============================================================================

TEST_F(EventManagerTest, EmitStoresAndPublishes) {
    auto stream = manager.events().as_stream();
    manager.emit(make_event("published"));

    EXPECT_EQ(manager.size(), 1u);
    auto received = stream.try_next();
    ASSERT_NE(received, nullptr);
    EXPECT_EQ(received->data().message(), "published");
    // Store and subscriber share one instance
    EXPECT_EQ(received.get(), manager.snapshot().front().get());
}

TEST_F(EventManagerTest, EmitThroughBusIsRetained) {
    manager.events().emit(make_event("via bus"));
    EXPECT_EQ(manager.size(), 1u);
}

TEST_F(EventManagerTest, EventIsStoredBeforeOtherHandlersRun) {
    std::size_t size_seen = 0;
    auto id = manager.events().subscribe([this, &size_seen](const EventManager::EventPtr&) {
        size_seen = manager.size();
    });
    manager.emit(make_event("x"));
    EXPECT_EQ(size_seen, 1u);
    manager.events().unsubscribe(id);
}

TEST_F(EventManagerTest, PushDoesNotPublish) {
    auto stream = manager.events().as_stream();
    manager.push(make_event("quiet"));

    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(stream.try_next(), nullptr);
}

// =============================================================================
// Queries
// =============================================================================

class EventManagerQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager.push(make_event("boot", Level::Info, "app::init"));
        manager.push(make_event("disk slow", Level::Error, "app::storage"));
        manager.push(make_event("ready", Level::Info, "app::init"));
        manager.push(make_event("cache miss", Level::Warn, "app::cache"));
    }

    EventManager manager;
};

TEST_F(EventManagerQueryTest, ByLevel) {
    EXPECT_EQ(messages(manager.get_by_level(Level::Info)), (std::vector<std::string>{"ready", "boot"}));
    EXPECT_TRUE(manager.get_by_level(Level::Trace).empty());
}

TEST_F(EventManagerQueryTest, ByTargetSubstring) {
    EXPECT_EQ(messages(manager.get_by_target("init")), (std::vector<std::string>{"ready", "boot"}));
    EXPECT_EQ(manager.get_by_target("app").size(), 4u);
    EXPECT_TRUE(manager.get_by_target("net").empty());
}

TEST_F(EventManagerQueryTest, Recent) {
    EXPECT_EQ(messages(manager.get_recent(2)), (std::vector<std::string>{"cache miss", "ready"}));
    EXPECT_EQ(manager.get_recent(100).size(), 4u);
    EXPECT_TRUE(manager.get_recent(0).empty());
}

TEST_F(EventManagerQueryTest, SearchConjunction) {
    SearchCriteria criteria;
    criteria.level = Level::Info;
    criteria.target = "init";
    criteria.message = "boo";
    EXPECT_EQ(messages(manager.search(criteria)), (std::vector<std::string>{"boot"}));

    EXPECT_EQ(manager.search(SearchCriteria{}).size(), 4u);
}

TEST_F(EventManagerQueryTest, QueriesDoNotMutate) {
    auto before = manager.snapshot();
    static_cast<void>(manager.get_by_level(Level::Error));
    static_cast<void>(manager.search(SearchCriteria{}));
    static_cast<void>(manager.get_recent(1));
    EXPECT_EQ(manager.snapshot(), before);
}

TEST_F(EventManagerQueryTest, ByThreadAndCorrelation) {
    Event tagged = make_event("tagged");
    tagged.with_thread_info("worker-7", std::nullopt).with_correlation_id("corr-1");
    manager.push(std::move(tagged));

    EXPECT_EQ(messages(manager.get_by_thread("worker-7")), (std::vector<std::string>{"tagged"}));
    EXPECT_TRUE(manager.get_by_thread("worker").empty());
    EXPECT_EQ(messages(manager.get_by_correlation_id("corr-1")), (std::vector<std::string>{"tagged"}));
    EXPECT_TRUE(manager.get_by_correlation_id("corr").empty());
}

TEST_F(EventManagerQueryTest, BySpan) {
    Event in_span = make_event("in span");
    in_span.with_span_stack({SpanInfo(1, "http_request", "app", Level::Info)});
    manager.push(std::move(in_span));

    Event in_current = make_event("in current");
    in_current.with_current_span(SpanInfo(2, "db_query", "app", Level::Info));
    manager.push(std::move(in_current));

    EXPECT_EQ(messages(manager.get_by_span("request")), (std::vector<std::string>{"in span"}));
    EXPECT_EQ(messages(manager.get_by_span("query")), (std::vector<std::string>{"in current"}));
    EXPECT_TRUE(manager.get_by_span("cache").empty());
}

// =============================================================================
// Summary
// =============================================================================

TEST(EventManagerSummaryTest, CountsPerLevel) {
    EventManager manager;
    manager.push(make_event("1", Level::Info));
    manager.push(make_event("2", Level::Error));
    manager.push(make_event("3", Level::Info));
    manager.push(make_event("4", Level::Warn));

    auto counts = manager.level_counts();
    EXPECT_EQ(counts.at(Level::Info), 2u);
    EXPECT_EQ(counts.at(Level::Error), 1u);
    EXPECT_EQ(counts.at(Level::Warn), 1u);
    EXPECT_EQ(counts.count(Level::Debug), 0u);

    EXPECT_EQ(manager.summary(),
              "Event Summary: 4 total events\n"
              "  ERROR: 1\n"
              "  WARN: 1\n"
              "  INFO: 2\n");
}

TEST(EventManagerSummaryTest, EmptyStore) {
    EventManager manager;
    EXPECT_EQ(manager.summary(), "Event Summary: 0 total events\n");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(EventManagerConcurrencyTest, ParallelEmitRespectsCapacity) {
    EventManager manager(100);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&manager, t] {
            for (int i = 0; i < 250; ++i) {
                manager.emit(make_event(std::to_string(t) + ":" + std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(manager.size(), 100u);
}
