#include <spanner/core/event_target.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace spanner::core;

using Target = EventTarget<std::string>;
using Value = Target::Value;

// =============================================================================
// Subscriptions
// =============================================================================

TEST(EventTargetTest, EmitWithoutSubscribersIsNoop) {
    Target target;
    target.emit(std::string("nobody listens"));
    EXPECT_EQ(target.listener_count(), 0u);
}

TEST(EventTargetTest, HandlersRunInSubscriptionOrder) {
    Target target;
    std::vector<std::string> calls;

    auto first = target.subscribe([&calls](const Value& v) { calls.push_back("first:" + *v); });
    auto second = target.subscribe([&calls](const Value& v) { calls.push_back("second:" + *v); });

    target.emit(std::string("x"));

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "first:x");
    EXPECT_EQ(calls[1], "second:x");
    EXPECT_TRUE(first.valid());
    EXPECT_NE(first.value(), second.value());
}

TEST(EventTargetTest, HandlersShareTheSameValue) {
    Target target;
    const std::string* seen_a = nullptr;
    const std::string* seen_b = nullptr;

    auto a = target.subscribe([&seen_a](const Value& v) { seen_a = v.get(); });
    auto b = target.subscribe([&seen_b](const Value& v) { seen_b = v.get(); });
    target.emit(std::string("shared"));

    EXPECT_NE(seen_a, nullptr);
    EXPECT_EQ(seen_a, seen_b);
}

TEST(EventTargetTest, UnsubscribeStopsDelivery) {
    Target target;
    int count = 0;
    auto id = target.subscribe([&count](const Value&) { ++count; });

    target.emit(std::string("one"));
    target.unsubscribe(id);
    target.emit(std::string("two"));

    EXPECT_EQ(count, 1);
    EXPECT_FALSE(id.valid());
    EXPECT_EQ(target.listener_count(), 0u);
}

TEST(EventTargetTest, UnsubscribeIsIdempotent) {
    Target target;
    auto id = target.subscribe([](const Value&) {});
    target.unsubscribe(id);
    target.unsubscribe(id);

    SubscriptionId never_valid;
    target.unsubscribe(never_valid);
    EXPECT_EQ(target.listener_count(), 0u);
}

TEST(EventTargetTest, ForeignIdIsIgnored) {
    Target a;
    Target b;
    int count = 0;
    auto id_a = a.subscribe([&count](const Value&) { ++count; });
    auto id_b = b.subscribe([](const Value&) {});

    a.unsubscribe(id_b);
    a.emit(std::string("still delivered"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(b.listener_count(), 1u);
    a.unsubscribe(id_a);
}

TEST(EventTargetTest, ScopedSubscriptionRemovesOnDestruction) {
    Target target;
    int count = 0;
    {
        auto scoped = target.subscribe_scoped([&count](const Value&) { ++count; });
        EXPECT_TRUE(scoped.active());
        target.emit(std::string("a"));
    }
    target.emit(std::string("b"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(target.listener_count(), 0u);
}

TEST(EventTargetTest, ScopedSubscriptionOutlivingTargetIsSafe) {
    ScopedSubscription<std::string> scoped;
    {
        Target target;
        scoped = target.subscribe_scoped([](const Value&) {});
        EXPECT_TRUE(scoped.active());
    }
    scoped.reset();
    EXPECT_FALSE(scoped.active());
}

TEST(EventTargetTest, ThrowingHandlerDoesNotStopDelivery) {
    Target target;
    int count = 0;
    auto bad = target.subscribe([](const Value&) { throw std::runtime_error("boom"); });
    auto good = target.subscribe([&count](const Value&) { ++count; });

    EXPECT_NO_THROW(target.emit(std::string("x")));
    EXPECT_EQ(count, 1);
}

// =============================================================================
// Reentrancy
// =============================================================================

TEST(EventTargetTest, HandlerMaySubscribeDuringEmit) {
    Target target;
    int late_calls = 0;
    std::vector<SubscriptionId> added;

    auto id = target.subscribe([&](const Value&) {
        added.push_back(target.subscribe([&late_calls](const Value&) { ++late_calls; }));
    });

    target.emit(std::string("first"));
    // The handler added during the first emit only sees later emissions
    EXPECT_EQ(late_calls, 0);

    target.unsubscribe(id);
    target.emit(std::string("second"));
    EXPECT_EQ(late_calls, 1);
}

TEST(EventTargetTest, HandlerMayUnsubscribeItself) {
    Target target;
    int count = 0;
    SubscriptionId id;
    id = target.subscribe([&](const Value&) {
        ++count;
        target.unsubscribe(id);
    });

    target.emit(std::string("a"));
    target.emit(std::string("b"));
    EXPECT_EQ(count, 1);
}

TEST(EventTargetTest, HandlerMayEmitRecursively) {
    Target target;
    std::vector<std::string> seen;
    auto id = target.subscribe([&](const Value& v) {
        seen.push_back(*v);
        if (*v == "outer") {
            target.emit(std::string("inner"));
        }
    });

    target.emit(std::string("outer"));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "outer");
    EXPECT_EQ(seen[1], "inner");
}

// =============================================================================
// Streams
// =============================================================================

TEST(EventTargetTest, StreamReceivesInEmitOrder) {
    Target target;
    auto stream = target.as_stream();

    target.emit(std::string("1"));
    target.emit(std::string("2"));
    target.emit(std::string("3"));

    EXPECT_EQ(stream.pending(), 3u);
    EXPECT_EQ(*stream.next(), "1");
    EXPECT_EQ(*stream.next(), "2");
    EXPECT_EQ(*stream.try_next(), "3");
    EXPECT_EQ(stream.try_next(), nullptr);
}

TEST(EventTargetTest, StreamOnlySeesLaterEmissions) {
    Target target;
    target.emit(std::string("before"));
    auto stream = target.as_stream();
    target.emit(std::string("after"));

    EXPECT_EQ(*stream.try_next(), "after");
    EXPECT_EQ(stream.try_next(), nullptr);
}

TEST(EventTargetTest, DroppingStreamRemovesItsSubscription) {
    Target target;
    {
        auto stream = target.as_stream();
        EXPECT_EQ(target.listener_count(), 1u);
    }
    EXPECT_EQ(target.listener_count(), 0u);
}

TEST(EventTargetTest, IndependentStreamsEachGetEveryValue) {
    Target target;
    auto a = target.as_stream();
    auto b = target.as_stream();
    target.emit(std::string("v"));

    EXPECT_EQ(*a.try_next(), "v");
    EXPECT_EQ(*b.try_next(), "v");
}

TEST(EventTargetTest, DefaultStreamStartsAtFirstRequest) {
    Target target;
    target.emit(std::string("unseen"));

    auto stream = target.default_stream();
    target.emit(std::string("seen"));

    EXPECT_EQ(*stream.try_next(), "seen");
    EXPECT_EQ(stream.try_next(), nullptr);
}

TEST(EventTargetTest, StreamsTerminateWhenTargetIsDestroyed) {
    auto target = std::make_unique<Target>();
    auto stream = target->as_stream();
    auto shared = target->default_stream();
    target->emit(std::string("last"));

    target.reset();

    EXPECT_TRUE(stream.closed());
    EXPECT_TRUE(shared.closed());
    // Buffered values drain before end-of-stream
    EXPECT_EQ(*stream.next(), "last");
    EXPECT_EQ(stream.next(), nullptr);
    EXPECT_EQ(*shared.next(), "last");
    EXPECT_EQ(shared.next(), nullptr);
}

TEST(EventTargetTest, BlockingNextWakesOnEmitFromAnotherThread) {
    Target target;
    auto stream = target.as_stream();

    std::thread producer([&target] { target.emit(std::string("ping")); });
    auto value = stream.next();
    producer.join();

    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "ping");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(EventTargetTest, ConcurrentEmitAndSubscribe) {
    Target target;
    std::atomic<int> delivered{0};
    auto counter = target.subscribe([&delivered](const Value&) { delivered.fetch_add(1); });

    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&target] {
            for (int i = 0; i < kPerThread; ++i) {
                target.emit(std::string("e"));
            }
        });
    }
    threads.emplace_back([&target] {
        for (int i = 0; i < 200; ++i) {
            auto id = target.subscribe([](const Value&) {});
            target.unsubscribe(id);
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(delivered.load(), kThreads * kPerThread);
    EXPECT_EQ(target.listener_count(), 1u);
}
