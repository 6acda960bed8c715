#include "lxmonitor/capture/CaptureBackend.hpp"
#include "lxmonitor/capture/NullCapture.hpp"
#include "lxmonitor/core/Error.hpp"
#include "lxmonitor/log/Log.hpp"

#include "ScriptedCapture.hpp"
#include "TestPackets.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace lxmonitor;
using namespace lxmonitor::monitor;
using testpackets::ScriptedCapture;
using testpackets::waitFor;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lxmonitor::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lxmonitor::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static PacketRouterHandle makeRouter() {
    return std::make_shared<PacketRouter>(std::make_shared<SourceRegistry>(),
                                          std::make_shared<DmxStore>(),
                                          std::make_shared<ListenerEventBus>(64));
}

static bool refusedWith(const expected<void>& r, MonitorErrc code) {
    return !r && r.error() == make_error_code(code);
}

static const std::uint8_t kConsole[4] = {10, 0, 0, 1};
static const std::uint8_t kFixture[4] = {10, 0, 0, 200};
static const std::uint8_t kGroup[4] = {239, 255, 0, 9};

static void testNullCapture() {
    capture::NullCapture backend(makeRouter());
    ASSERT_TRUE(!backend.available(), "null backend has no driver");
    ASSERT_TRUE(backend.interfaces().empty(), "null backend lists nothing");
    ASSERT_TRUE(refusedWith(backend.start("eth0"), MonitorErrc::CaptureUnavailable), "start refused");

    const auto status = backend.status();
    ASSERT_TRUE(!status.enabled, "not enabled");
    ASSERT_TRUE(!status.driverAvailable, "driver unavailable");
    ASSERT_TRUE(!status.interface.has_value(), "no interface recorded");
}

static void testReplayRoutesFrames() {
    auto router = makeRouter();
    std::vector<std::vector<std::uint8_t>> frames;
    frames.push_back(testpackets::ethernetFrame(kConsole, kFixture, 6454, 6454,
                                                testpackets::artDmx(4, 1, {1, 2, 3})));
    frames.push_back(testpackets::ethernetFrame(kConsole, kGroup, 50000, 5568,
                                                testpackets::sacnDmx(9, 1, {7})));
    std::vector<std::uint8_t> arp(60, 0);
    arp[12] = 0x08;
    arp[13] = 0x06;
    frames.push_back(arp);
    frames.push_back(testpackets::ethernetFrame(kConsole, kFixture, 1234, 80, {1, 2, 3}));

    ScriptedCapture backend(router, {{"eth0", "Ethernet"}, {"wlan0", "Wireless"}}, frames);

    ASSERT_TRUE(refusedWith(backend.start("eth9"), MonitorErrc::UnknownInterface), "unknown interface refused");
    ASSERT_EQ(backend.opens.load(), 0, "refusal opens nothing");

    auto started = backend.start("wlan0");
    ASSERT_TRUE(started.has_value(), "known interface starts");
    ASSERT_TRUE(backend.openedName == "wlan0", "named interface opened");
    ASSERT_TRUE(refusedWith(backend.start("eth0"), MonitorErrc::CaptureAlreadyRunning), "second start refused");

    ASSERT_TRUE(waitFor([&] { return backend.status().packetsCaptured == 4; }), "every frame counted");

    auto status = backend.status();
    ASSERT_TRUE(status.enabled, "enabled while running");
    ASSERT_TRUE(status.driverAvailable, "driver available");
    ASSERT_TRUE(status.interface == std::optional<std::string>("wlan0"), "interface reported");
    ASSERT_TRUE(!status.lastError.has_value(), "no error");

    const auto& registry = router->registry();
    ASSERT_TRUE(registry->find("artnet-10.0.0.1").has_value(), "art-net sender seen");
    auto fixture = registry->find("artnet-10.0.0.200");
    ASSERT_TRUE(fixture && fixture->direction == SourceDirection::Receiving, "unicast receiver inferred");
    ASSERT_TRUE(registry->find("sacn-" + sacn::cidToString(testpackets::cid(1))).has_value(), "sacn sender seen");
    ASSERT_EQ(registry->size(), static_cast<std::size_t>(3), "multicast and non-lighting frames add no sources");
    ASSERT_TRUE(router->store()->get(4).has_value(), "art-net frame stored");
    ASSERT_TRUE(router->store()->get(9).has_value(), "sacn frame stored");

    backend.stop();
    ASSERT_TRUE(!backend.isRunning(), "stopped");
    ASSERT_TRUE(!backend.status().enabled, "disabled after stop");
    ASSERT_EQ(backend.closes.load(), 1, "device closed once");
    ASSERT_EQ(backend.status().packetsCaptured, static_cast<std::uint64_t>(4), "count survives stop");

    backend.stop();
    ASSERT_EQ(backend.closes.load(), 1, "second stop is a no-op");
}

static void testRestartKeepsCounting() {
    std::vector<std::vector<std::uint8_t>> frames = {
        testpackets::ethernetFrame(kConsole, kFixture, 6454, 6454, testpackets::artDmx(1, 0, {1})),
    };
    ScriptedCapture backend(makeRouter(), {{"eth0", ""}}, frames);

    ASSERT_TRUE(backend.start("eth0").has_value(), "first start");
    ASSERT_TRUE(waitFor([&] { return backend.status().packetsCaptured == 1; }), "first run counted");
    backend.stop();

    ASSERT_TRUE(backend.start("eth0").has_value(), "restart");
    ASSERT_TRUE(waitFor([&] { return backend.status().packetsCaptured == 2; }), "counter is cumulative");
    backend.stop();
    ASSERT_EQ(backend.opens.load(), 2, "opened per start");
}

static void testWorkerFailure() {
    ScriptedCapture backend(makeRouter(), {{"eth0", ""}}, {}, true);
    ASSERT_TRUE(backend.start("eth0").has_value(), "starts");
    ASSERT_TRUE(waitFor([&] { return !backend.isRunning(); }), "worker ends on failure");

    auto status = backend.status();
    ASSERT_TRUE(!status.enabled, "failure disables capture");
    ASSERT_TRUE(status.lastError == std::optional<std::string>("scripted device went away"), "last error kept");

    // A failed worker can be restarted; the error clears.
    ASSERT_TRUE(backend.start("eth0").has_value(), "restart after failure");
    ASSERT_EQ(backend.closes.load(), 1, "failed session closed before reopening");
    ASSERT_TRUE(waitFor([&] { return !backend.isRunning(); }), "fails again");
    backend.stop();
    ASSERT_EQ(backend.closes.load(), 2, "second session closed by stop");
}

static void testConcurrentStart() {
    ScriptedCapture backend(makeRouter(), {{"eth0", ""}});
    backend.openDelay = std::chrono::milliseconds(50);

    expected<void> first;
    expected<void> second;
    std::thread a([&] { first = backend.start("eth0"); });
    std::thread b([&] { second = backend.start("eth0"); });
    a.join();
    b.join();

    ASSERT_TRUE(first.has_value() != second.has_value(), "exactly one start wins");
    ASSERT_TRUE(refusedWith(first, MonitorErrc::CaptureAlreadyRunning)
                || refusedWith(second, MonitorErrc::CaptureAlreadyRunning), "loser sees already running");
    ASSERT_EQ(backend.opens.load(), 1, "device opened once");
    ASSERT_TRUE(backend.isRunning(), "winner is running");

    // stop() racing start() leaves one consistent outcome.
    std::thread stopper([&] { backend.stop(); });
    std::thread starter([&] {
        const auto r = backend.start("eth0");
        ASSERT_TRUE(r.has_value() || refusedWith(r, MonitorErrc::CaptureAlreadyRunning), "start during stop");
    });
    stopper.join();
    starter.join();
    backend.stop();
    ASSERT_TRUE(!backend.isRunning(), "stopped");
    ASSERT_EQ(backend.closes.load(), backend.opens.load(), "every open closed");
}

int main() {
    testNullCapture();
    testReplayRoutesFrames();
    testRestartKeepsCounting();
    testWorkerFailure();
    testConcurrentStart();

    if (g_failures) {
        lxmonitor::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lxmonitor::logInfo("Capture backend tests passed.\n");
    return 0;
}
