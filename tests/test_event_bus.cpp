#include "lxmonitor/monitor/EventBus.hpp"
#include "lxmonitor/monitor/ListenerEvent.hpp"
#include "lxmonitor/log/Log.hpp"

#include <chrono>
#include <thread>

using namespace lxmonitor::monitor;
using std::chrono::milliseconds;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lxmonitor::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lxmonitor::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

using IntBus = EventBus<int>;

static bool isError(const IntBus::Subscription::Result& r, RecvError::Kind kind) {
    return !r && r.error().kind == kind;
}

static void testOrderAndEmpty() {
    IntBus bus(8);
    auto sub = bus.subscribe();
    ASSERT_TRUE(isError(sub.tryReceive(), RecvError::Kind::Empty), "nothing published yet");

    bus.publish(1);
    bus.publish(2);
    bus.publish(3);
    for (int expected = 1; expected <= 3; ++expected) {
        auto r = sub.tryReceive();
        ASSERT_TRUE(r.has_value(), "event available");
        if (r) ASSERT_EQ(*r, expected, "published order");
    }
    ASSERT_TRUE(isError(sub.tryReceive(), RecvError::Kind::Empty), "drained");
}

static void testLateSubscriberSeesOnlyNewEvents() {
    IntBus bus(8);
    bus.publish(1);
    auto sub = bus.subscribe();
    bus.publish(2);
    auto r = sub.tryReceive();
    ASSERT_TRUE(r && *r == 2, "events before subscribe are not replayed");
}

static void testTimeout() {
    IntBus bus(4);
    auto sub = bus.subscribe();
    const auto start = std::chrono::steady_clock::now();
    auto r = sub.receive(milliseconds(50));
    const auto waited = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(isError(r, RecvError::Kind::Timeout), "receive times out");
    ASSERT_TRUE(waited >= milliseconds(40), "receive actually waited");
}

static void testBlockingReceiveWakesOnPublish() {
    IntBus bus(4);
    auto sub = bus.subscribe();
    std::thread publisher([&bus] {
        std::this_thread::sleep_for(milliseconds(20));
        bus.publish(42);
    });
    auto r = sub.receive(milliseconds(2000));
    publisher.join();
    ASSERT_TRUE(r && *r == 42, "woken by publish");
}

static void testLagged() {
    IntBus bus(4);
    auto sub = bus.subscribe();
    for (int i = 0; i < 10; ++i) bus.publish(i);

    auto r = sub.tryReceive();
    ASSERT_TRUE(isError(r, RecvError::Kind::Lagged), "slow subscriber lags");
    if (!r) ASSERT_EQ(r.error().missed, 6u, "six events dropped");

    // Resumes at the oldest event still buffered.
    for (int expected = 6; expected < 10; ++expected) {
        auto next = sub.tryReceive();
        ASSERT_TRUE(next && *next == expected, "resumed in order");
    }
    ASSERT_TRUE(isError(sub.tryReceive(), RecvError::Kind::Empty), "caught up");
}

static void testMultipleSubscribers() {
    IntBus bus(4);
    auto fast = bus.subscribe();
    auto slow = bus.subscribe();

    bus.publish(1);
    ASSERT_TRUE(fast.tryReceive().value_or(-1) == 1, "fast reads 1");
    bus.publish(2);
    ASSERT_TRUE(fast.tryReceive().value_or(-1) == 2, "fast reads 2");

    ASSERT_TRUE(slow.tryReceive().value_or(-1) == 1, "slow still sees 1");
    ASSERT_TRUE(slow.tryReceive().value_or(-1) == 2, "slow still sees 2");
}

static void testClosed() {
    IntBus bus(4);
    auto sub = bus.subscribe();
    bus.publish(7);
    bus.close();
    bus.publish(8); // ignored after close

    auto r = sub.tryReceive();
    ASSERT_TRUE(r && *r == 7, "buffered event still delivered after close");
    ASSERT_TRUE(isError(sub.tryReceive(), RecvError::Kind::Closed), "then Closed");
    ASSERT_TRUE(isError(sub.receive(milliseconds(1000)), RecvError::Kind::Closed), "receive returns Closed immediately");
}

static void testListenerEvents() {
    ListenerEventBus bus(16);
    auto sub = bus.subscribe();
    bus.publish(SourcesChanged{});
    bus.publish(FrameUpdated{7, "10.0.0.1", 1234, DmxFrame{1, 2}});

    auto first = sub.tryReceive();
    ASSERT_TRUE(first && std::holds_alternative<SourcesChanged>(*first), "sources changed");
    auto second = sub.tryReceive();
    ASSERT_TRUE(second && std::holds_alternative<FrameUpdated>(*second), "frame updated");
    if (second && std::holds_alternative<FrameUpdated>(*second)) {
        const auto& frame = std::get<FrameUpdated>(*second);
        ASSERT_EQ(frame.universe, 7, "universe");
        ASSERT_TRUE(frame.sourceIp == "10.0.0.1", "source ip");
        ASSERT_TRUE(frame.data == DmxFrame({1, 2}), "data");
    }
}

int main() {
    testOrderAndEmpty();
    testLateSubscriberSeesOnlyNewEvents();
    testTimeout();
    testBlockingReceiveWakesOnPublish();
    testLagged();
    testMultipleSubscribers();
    testClosed();
    testListenerEvents();

    if (g_failures) {
        lxmonitor::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lxmonitor::logInfo("Event bus tests passed.\n");
    return 0;
}
