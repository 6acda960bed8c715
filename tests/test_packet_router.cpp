#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/monitor/PacketRouter.hpp"
#include "lxmonitor/sacn/SacnProtocol.hpp"

#include "TestPackets.hpp"

#include <memory>
#include <string>
#include <string_view>

using namespace lxmonitor;
using namespace lxmonitor::monitor;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lxmonitor::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lxmonitor::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

struct Fixture {
    SourceRegistryHandle registry = std::make_shared<SourceRegistry>();
    DmxStoreHandle store = std::make_shared<DmxStore>();
    ListenerEventBusHandle events = std::make_shared<ListenerEventBus>(64);
    PacketRouter router{registry, store, events};
    ListenerEventBus::Subscription sub = events->subscribe();
};

static net::address_v4 ip(const char* text) {
    return net::asio::ip::make_address_v4(text);
}

static void testArtDmx() {
    Fixture f;
    auto packet = artnet::decode(testpackets::artDmx(3, 1, {10, 20, 30}));
    ASSERT_TRUE(packet.has_value(), "dmx decodes");
    if (!packet) return;
    f.router.routeArtNet(*packet, ip("10.0.0.5"));

    auto node = f.registry->find("artnet-10.0.0.5");
    ASSERT_TRUE(node && node->direction == SourceDirection::Sending, "sender recorded as sending");
    ASSERT_TRUE(node && node->universes == std::vector<std::uint16_t>({3}), "universe recorded");

    auto frame = f.store->get(3);
    ASSERT_TRUE(frame && *frame == DmxFrame({10, 20, 30}), "frame stored");

    auto event = f.sub.tryReceive();
    ASSERT_TRUE(event && std::holds_alternative<FrameUpdated>(*event), "frame event published");
    if (event && std::holds_alternative<FrameUpdated>(*event)) {
        const auto& update = std::get<FrameUpdated>(*event);
        ASSERT_EQ(update.universe, 3, "event universe");
        ASSERT_TRUE(update.sourceIp == "10.0.0.5", "event source");
        ASSERT_TRUE(update.timestampMs > 0, "event timestamp");
    }
}

static void testPollReply() {
    Fixture f;
    testpackets::PollReplyFields fields;
    auto packet = artnet::decode(testpackets::artPollReply(fields));
    ASSERT_TRUE(packet.has_value(), "reply decodes");
    if (!packet) return;
    // The node's own IP field names it, not the datagram sender.
    f.router.routeArtNet(*packet, ip("10.0.0.99"));

    auto node = f.registry->find("artnet-10.0.0.50");
    ASSERT_TRUE(node.has_value(), "node keyed by its reported ip");
    ASSERT_TRUE(node && node->name == "Stage Left Node", "long name used");
    ASSERT_TRUE(node && node->macAddress == std::string("00:11:22:AA:BB:CC"), "mac recorded");
    ASSERT_TRUE(node && node->universes == std::vector<std::uint16_t>({1, 2}), "output universes");

    auto event = f.sub.tryReceive();
    ASSERT_TRUE(event && std::holds_alternative<SourcesChanged>(*event), "sources changed published");
    ASSERT_EQ(f.store->universeCount(), static_cast<std::size_t>(0), "no frames from a reply");
}

static void testPollIgnored() {
    Fixture f;
    auto packet = artnet::decode(artnet::encodePoll());
    if (packet) f.router.routeArtNet(*packet, ip("10.0.0.1"));
    ASSERT_EQ(f.registry->size(), static_cast<std::size_t>(0), "polls do not create sources");
    ASSERT_TRUE(!f.sub.tryReceive().has_value(), "no event for a poll");
}

static void testSacnDmx() {
    Fixture f;
    const auto c = testpackets::cid(0x40);
    auto packet = sacn::decode(testpackets::sacnDmx(7, 3, {255, 0}, c, "Desk", 110));
    ASSERT_TRUE(packet.has_value(), "sacn decodes");
    if (!packet) return;
    f.router.routeSacn(*packet, ip("10.0.0.7"));

    auto console = f.registry->find("sacn-" + sacn::cidToString(c));
    ASSERT_TRUE(console && console->name == "Desk", "source name");
    ASSERT_TRUE(console && console->ip == "10.0.0.7", "sender ip");
    ASSERT_TRUE(console && console->sacnPriority == std::optional<std::uint8_t>(110), "priority");
    ASSERT_TRUE(f.store->get(7) == std::optional<DmxFrame>(DmxFrame{255, 0}), "frame stored");

    auto event = f.sub.tryReceive();
    ASSERT_TRUE(event && std::holds_alternative<FrameUpdated>(*event), "frame event published");
}

static void testSacnDiscovery() {
    Fixture f;
    const auto c = testpackets::cid(0x50);
    auto packet = sacn::decode(testpackets::sacnDiscovery({4, 5}, c, "Backup"));
    ASSERT_TRUE(packet.has_value(), "discovery decodes");
    if (!packet) return;
    f.router.routeSacn(*packet, ip("10.0.0.8"));

    auto backup = f.registry->find("sacn-" + sacn::cidToString(c));
    ASSERT_TRUE(backup && backup->universes == std::vector<std::uint16_t>({4, 5}), "advertised universes");
    ASSERT_TRUE(backup && backup->name == "Backup", "discovery name");
    ASSERT_TRUE(backup && backup->direction == SourceDirection::Unknown, "discovery alone says nothing about direction");
    ASSERT_EQ(f.store->universeCount(), static_cast<std::size_t>(0), "no frames from discovery");

    auto event = f.sub.tryReceive();
    ASSERT_TRUE(event && std::holds_alternative<SourcesChanged>(*event), "sources changed published");
}

static void testCapturedArtNet() {
    Fixture f;
    auto packet = artnet::decode(testpackets::artDmx(1, 0, {1}));
    if (!packet) { ASSERT_TRUE(false, "dmx decodes"); return; }

    f.router.routeCapturedArtNet(*packet, ip("10.0.0.1"), ip("10.0.0.200"));
    auto sender = f.registry->find("artnet-10.0.0.1");
    auto fixture = f.registry->find("artnet-10.0.0.200");
    ASSERT_TRUE(sender && sender->direction == SourceDirection::Sending, "captured sender");
    ASSERT_TRUE(fixture && fixture->direction == SourceDirection::Receiving, "unicast destination is a receiver");
    ASSERT_TRUE(fixture && fixture->universes == std::vector<std::uint16_t>({1}), "receiver universe");

    f.router.routeCapturedArtNet(*packet, ip("10.0.0.1"), ip("255.255.255.255"));
    f.router.routeCapturedArtNet(*packet, ip("10.0.0.1"), ip("239.255.0.1"));
    ASSERT_TRUE(!f.registry->find("artnet-255.255.255.255").has_value(), "limited broadcast is not a receiver");
    ASSERT_TRUE(!f.registry->find("artnet-239.255.0.1").has_value(), "multicast group is not a receiver");
    ASSERT_EQ(f.registry->size(), static_cast<std::size_t>(2), "sender and one receiver");

    // On a /8 Art-Net network a .255 last octet is an ordinary host.
    f.router.routeCapturedArtNet(*packet, ip("10.0.0.1"), ip("10.0.1.255"));
    auto host = f.registry->find("artnet-10.0.1.255");
    ASSERT_TRUE(host && host->direction == SourceDirection::Receiving, "x.x.x.255 host recorded as receiver");
}

static void testCapturedSacn() {
    Fixture f;
    auto packet = sacn::decode(testpackets::sacnDmx(2, 0, {5}));
    if (!packet) { ASSERT_TRUE(false, "sacn decodes"); return; }

    f.router.routeCapturedSacn(*packet, ip("10.0.0.1"), ip("239.255.0.2"));
    ASSERT_EQ(f.registry->size(), static_cast<std::size_t>(1), "multicast destination is not a receiver");

    f.router.routeCapturedSacn(*packet, ip("10.0.0.1"), ip("10.0.0.30"));
    auto fixture = f.registry->find("sacn-10.0.0.30");
    ASSERT_TRUE(fixture.has_value(), "unicast sacn receiver keyed by ip");
    ASSERT_TRUE(fixture && fixture->direction == SourceDirection::Receiving, "receiver direction");
    ASSERT_TRUE(f.store->get(2).has_value(), "captured frame stored");
}

static void testIgnoredOpcodeLogsAtDebug() {
    Fixture f;
    auto bytes = artnet::encodePoll();
    bytes[8] = 0x00;
    bytes[9] = 0x52; // OpSync
    auto packet = artnet::decode(bytes);
    if (!packet) { ASSERT_TRUE(false, "sync decodes"); return; }

    std::string captured;
    setLogHandlers([&captured](std::string_view m) { captured += m; }, nullptr);

    f.router.routeArtNet(*packet, ip("10.0.0.3"));
    ASSERT_TRUE(captured.empty(), "silent while debug logging is off");

    setDebugLogging(true);
    f.router.routeArtNet(*packet, ip("10.0.0.3"));
    setDebugLogging(false);
    resetLogHandlers();

    ASSERT_TRUE(captured.find("OpSync") != std::string::npos, "opcode named in the debug line");
    ASSERT_TRUE(captured.find("10.0.0.3") != std::string::npos, "sender named in the debug line");
    ASSERT_EQ(f.registry->size(), static_cast<std::size_t>(0), "ignored opcodes create no source");
}

static void testGroupAddress() {
    ASSERT_TRUE(PacketRouter::isGroupAddress(ip("239.255.0.1")), "multicast");
    ASSERT_TRUE(PacketRouter::isGroupAddress(ip("255.255.255.255")), "limited broadcast");
    ASSERT_TRUE(!PacketRouter::isGroupAddress(ip("192.168.1.20")), "unicast host");
    ASSERT_TRUE(!PacketRouter::isGroupAddress(ip("10.0.1.255")), "last octet 255 is not enough");
    ASSERT_TRUE(!PacketRouter::isGroupAddress(ip("2.0.0.255")), "host on a /8 art-net network");
}

int main() {
    testArtDmx();
    testPollReply();
    testPollIgnored();
    testSacnDmx();
    testSacnDiscovery();
    testCapturedArtNet();
    testCapturedSacn();
    testIgnoredOpcodeLogsAtDebug();
    testGroupAddress();

    if (g_failures) {
        lxmonitor::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lxmonitor::logInfo("Packet router tests passed.\n");
    return 0;
}
