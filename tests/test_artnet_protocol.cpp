#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/log/Log.hpp"

#include "TestPackets.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace lxmonitor::artnet;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lxmonitor::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lxmonitor::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testPollRoundTrip() {
    const auto bytes = encodePoll();
    ASSERT_EQ(bytes.size(), static_cast<std::size_t>(14), "poll is 14 bytes");
    ASSERT_EQ(bytes[8], 0x00, "opcode low byte");
    ASSERT_EQ(bytes[9], 0x20, "opcode high byte");
    ASSERT_EQ(bytes[10], 0, "protocol version hi");
    ASSERT_EQ(bytes[11], 14, "protocol version lo");
    ASSERT_EQ(bytes[12], ARTPOLL_FLAG_REPLY_ON_CHANGE, "flags request reply on change");
    ASSERT_EQ(bytes[13], ARTPOLL_DIAG_PRIORITY_LOW, "diag priority low");
    ASSERT_TRUE(bytes == encodePoll(), "encodePoll is deterministic");

    auto packet = decode(bytes);
    ASSERT_TRUE(packet.has_value(), "poll decodes");
    ASSERT_TRUE(packet && std::holds_alternative<ArtPoll>(*packet), "poll classifies as ArtPoll");
}

static void testDmxPayload() {
    std::vector<std::uint8_t> levels(24);
    for (std::size_t i = 0; i < levels.size(); ++i) levels[i] = static_cast<std::uint8_t>(i * 10);

    const auto bytes = testpackets::artDmx(0x0123, 42, levels);
    auto packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtDmx>(*packet), "dmx classifies as ArtDmx");
    if (!packet || !std::holds_alternative<ArtDmx>(*packet)) return;

    const auto& dmx = std::get<ArtDmx>(*packet);
    ASSERT_EQ(dmx.sequence, 42, "sequence");
    ASSERT_EQ(dmx.universe, 0x0123, "universe packs net<<8 | subuni");
    ASSERT_EQ(dmx.length, 24, "declared length");
    ASSERT_TRUE(dmx.data == std::vector<std::uint8_t>(bytes.begin() + 18, bytes.begin() + 18 + 24),
                "payload equals bytes [18, 18+L)");
}

static void testDmxTruncatedPayload() {
    auto bytes = testpackets::artDmx(1, 0, std::vector<std::uint8_t>(100, 0xFF));
    bytes.resize(18 + 50); // header still claims 100
    ASSERT_TRUE(!decode(bytes).has_value(), "payload shorter than declared length is rejected");

    auto header = testpackets::artDmx(1, 0, {});
    header.resize(17);
    ASSERT_TRUE(!decode(header).has_value(), "dmx shorter than 18 bytes is rejected");
}

static void testDmxLengthCappedAt512() {
    auto bytes = testpackets::artDmx(1, 0, std::vector<std::uint8_t>(600, 0x11));
    auto packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtDmx>(*packet), "oversized dmx still decodes");
    if (packet && std::holds_alternative<ArtDmx>(*packet)) {
        ASSERT_EQ(std::get<ArtDmx>(*packet).data.size(), static_cast<std::size_t>(512), "payload capped at 512");
    }
}

static void testCalculateUniverse() {
    ASSERT_EQ(calculateUniverse(1, 2, 3), 0x123, "calculateUniverse(1,2,3)");
    ASSERT_EQ(calculateUniverse(0xFF, 0xFF, 0xFF), 0x7FFF, "fields are masked");
    static_assert(calculateUniverse(0, 0, 5) == 5, "usable in constant expressions");
}

static void testRejectsGarbage() {
    ASSERT_TRUE(!decode(nullptr, 0).has_value(), "null buffer");
    std::vector<std::uint8_t> shortBuf = {'A', 'r', 't', '-', 'N', 'e', 't', 0, 0x00, 0x50, 0};
    ASSERT_TRUE(!decode(shortBuf).has_value(), "11 bytes is too short");

    auto bad = encodePoll();
    bad[0] = 'X';
    ASSERT_TRUE(!decode(bad).has_value(), "wrong header literal");

    auto noNul = encodePoll();
    noNul[7] = ' ';
    ASSERT_TRUE(!decode(noNul).has_value(), "header must include the NUL");
}

static void testOtherOpcode() {
    auto bytes = encodePoll();
    bytes[8] = 0x00;
    bytes[9] = 0x52; // OpSync
    auto packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtOther>(*packet), "known but unhandled opcode is ArtOther");
    if (packet && std::holds_alternative<ArtOther>(*packet)) {
        ASSERT_EQ(std::get<ArtOther>(*packet).opcode, 0x5200, "raw opcode kept");
    }

    bytes[8] = 0x34;
    bytes[9] = 0x12;
    packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtOther>(*packet), "unknown opcode is ArtOther");
    ASSERT_TRUE(std::string(opcodeName(0x1234)) == "OpUnknown", "unknown opcode name");
    ASSERT_TRUE(std::string(opcodeName(0x5000)) == "OpDmx", "dmx opcode name");
}

static void testPollReply() {
    testpackets::PollReplyFields fields;
    fields.netSwitch = 1;
    fields.subSwitch = 2;
    const auto bytes = testpackets::artPollReply(fields);
    ASSERT_EQ(bytes.size(), static_cast<std::size_t>(213), "reply with trailer is 213 bytes");

    auto packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtPollReply>(*packet), "reply classifies as ArtPollReply");
    if (!packet || !std::holds_alternative<ArtPollReply>(*packet)) return;

    const auto& reply = std::get<ArtPollReply>(*packet);
    ASSERT_EQ(reply.ipAddress[0], 10, "ip[0]");
    ASSERT_EQ(reply.ipAddress[3], 50, "ip[3]");
    ASSERT_EQ(reply.port, 6454, "port is little-endian");
    ASSERT_EQ(reply.versionInfo, 0x0102, "version is big-endian");
    ASSERT_EQ(reply.estaManufacturer, 0x7FF0, "esta is little-endian");
    ASSERT_TRUE(reply.shortName == "Node", "short name");
    ASSERT_TRUE(reply.longName == "Stage Left Node", "long name");
    ASSERT_TRUE(reply.nodeReport == "#0001 [0000] ok", "node report");
    ASSERT_EQ(reply.numPorts, 2, "port count");
    ASSERT_EQ(reply.macAddress[5], 0xCC, "mac");
    ASSERT_EQ(reply.bindIndex, 1, "bind index");
    ASSERT_EQ(reply.status2, 0x08, "status2");
    ASSERT_TRUE(formatMac(reply.macAddress) == "00:11:22:AA:BB:CC", "formatted mac");

    const auto universes = reply.outputUniverses();
    ASSERT_EQ(universes.size(), static_cast<std::size_t>(2), "two output ports");
    if (universes.size() == 2) {
        ASSERT_EQ(universes[0], 0x121, "port 0 universe");
        ASSERT_EQ(universes[1], 0x122, "port 1 universe");
    }
}

static void testPollReplyWithoutTrailer() {
    testpackets::PollReplyFields fields;
    fields.includeTrailer = false;
    const auto bytes = testpackets::artPollReply(fields);
    ASSERT_EQ(bytes.size(), static_cast<std::size_t>(207), "minimal reply is 207 bytes");

    auto packet = decode(bytes);
    ASSERT_TRUE(packet && std::holds_alternative<ArtPollReply>(*packet), "minimal reply decodes");
    if (packet && std::holds_alternative<ArtPollReply>(*packet)) {
        const auto& reply = std::get<ArtPollReply>(*packet);
        ASSERT_EQ(reply.bindIp[0], 0, "missing bind ip stays zero");
        ASSERT_EQ(reply.status2, 0, "missing status2 stays zero");
    }

    auto truncated = bytes;
    truncated.resize(206);
    ASSERT_TRUE(!decode(truncated).has_value(), "reply under 207 bytes is rejected");
}

int main() {
    testPollRoundTrip();
    testDmxPayload();
    testDmxTruncatedPayload();
    testDmxLengthCappedAt512();
    testCalculateUniverse();
    testRejectsGarbage();
    testOtherOpcode();
    testPollReply();
    testPollReplyWithoutTrailer();

    if (g_failures) {
        lxmonitor::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lxmonitor::logInfo("Art-Net protocol tests passed.\n");
    return 0;
}
