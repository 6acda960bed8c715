// ArtNetProtocol.cpp
// -----------------------------------------------------------------------------
// Fixed-offset Art-Net decoding. Offsets follow the Art-Net 4 packet tables;
// every read is preceded by a length check so a truncated datagram degrades to
// std::nullopt (or omitted trailing fields) rather than an out-of-range read.

#include "lxmonitor/artnet/ArtNetProtocol.hpp"

#include "lxmonitor/core/ByteBuffer.hpp"
#include "lxmonitor/core/ByteOrder.hpp"
#include "lxmonitor/core/Config.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace lxmonitor::artnet {
namespace {

using core::readFixedString;
using core::readUInt16Be;
using core::readUInt16Le;

template <std::size_t N>
void copyField(std::array<std::uint8_t, N>& out, const std::uint8_t* src) {
    std::copy(src, src + N, out.begin());
}

ArtPollReply decodePollReply(const std::uint8_t* data, std::size_t size) {
    ArtPollReply reply;

    copyField(reply.ipAddress, data + 10);
    reply.port = readUInt16Le(data + 14);
    reply.versionInfo = readUInt16Be(data + 16);
    reply.netSwitch = data[18];
    reply.subSwitch = data[19];
    reply.oem = readUInt16Be(data + 20);
    reply.ubeaVersion = data[22];
    reply.status1 = data[23];
    reply.estaManufacturer = readUInt16Le(data + 24);
    reply.shortName = readFixedString(data + 26, 18);
    reply.longName = readFixedString(data + 44, 64);
    reply.nodeReport = readFixedString(data + 108, 64);
    reply.numPorts = readUInt16Be(data + 172);
    copyField(reply.portTypes, data + 174);
    copyField(reply.goodInput, data + 178);
    copyField(reply.goodOutput, data + 182);
    copyField(reply.swIn, data + 186);
    copyField(reply.swOut, data + 190);

    // Older nodes send shorter replies; missing trailing fields stay zero.
    if (size > 200) reply.style = data[200];
    if (size >= 207) copyField(reply.macAddress, data + 201);
    if (size >= 211) copyField(reply.bindIp, data + 207);
    if (size > 211) reply.bindIndex = data[211];
    if (size > 212) reply.status2 = data[212];

    return reply;
}

std::optional<ArtDmx> decodeDmx(const std::uint8_t* data, std::size_t size) {
    if (size < ARTNET_DMX_HEADER_SIZE) {
        return std::nullopt;
    }

    ArtDmx dmx;
    dmx.sequence = data[12];
    dmx.physical = data[13];
    dmx.universe = static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[15]) << 8) | data[14]);
    dmx.length = readUInt16Be(data + 16);

    const std::size_t payload = std::min<std::size_t>(dmx.length, config::DMX_UNIVERSE_SIZE);
    if (size < ARTNET_DMX_HEADER_SIZE + payload) {
        return std::nullopt;
    }
    dmx.data.assign(data + ARTNET_DMX_HEADER_SIZE, data + ARTNET_DMX_HEADER_SIZE + payload);
    return dmx;
}

} // namespace

std::optional<Packet> decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < ARTNET_MIN_PACKET_SIZE) {
        return std::nullopt;
    }
    if (std::memcmp(data, ARTNET_ID, sizeof(ARTNET_ID)) != 0) {
        return std::nullopt;
    }

    const std::uint16_t opcode = readUInt16Le(data + 8);
    switch (static_cast<OpCode>(opcode)) {
        case OpCode::Poll:
            return Packet{ArtPoll{}};
        case OpCode::PollReply:
            if (size < ARTNET_POLL_REPLY_MIN_SIZE) return std::nullopt;
            return Packet{decodePollReply(data, size)};
        case OpCode::Dmx:
            if (auto dmx = decodeDmx(data, size)) return Packet{std::move(*dmx)};
            return std::nullopt;
        default:
            return Packet{ArtOther{opcode}};
    }
}

std::vector<std::uint8_t> encodePoll() {
    core::ByteBuffer buffer(ARTNET_POLL_SIZE);
    buffer.appendBytes(reinterpret_cast<const std::uint8_t*>(ARTNET_ID), sizeof(ARTNET_ID));
    buffer.appendUInt16Le(static_cast<std::uint16_t>(OpCode::Poll));
    buffer.appendUInt16Be(ARTNET_PROTOCOL_VERSION);
    buffer.appendUInt8(ARTPOLL_FLAG_REPLY_ON_CHANGE);
    buffer.appendUInt8(ARTPOLL_DIAG_PRIORITY_LOW);
    return buffer.release();
}

std::vector<std::uint16_t> ArtPollReply::outputUniverses() const {
    std::vector<std::uint16_t> universes;
    const std::size_t ports = std::min<std::size_t>(numPorts, portTypes.size());
    for (std::size_t i = 0; i < ports; ++i) {
        if (portTypes[i] & PORT_TYPE_OUTPUT) {
            universes.push_back(calculateUniverse(netSwitch, subSwitch, swOut[i]));
        }
    }
    return universes;
}

const char* opcodeName(std::uint16_t opcode) {
    switch (static_cast<OpCode>(opcode)) {
        case OpCode::Poll:        return "OpPoll";
        case OpCode::PollReply:   return "OpPollReply";
        case OpCode::Dmx:         return "OpDmx";
        case OpCode::Nzs:         return "OpNzs";
        case OpCode::Sync:        return "OpSync";
        case OpCode::Address:     return "OpAddress";
        case OpCode::Input:       return "OpInput";
        case OpCode::TodRequest:  return "OpTodRequest";
        case OpCode::TodData:     return "OpTodData";
        case OpCode::TodControl:  return "OpTodControl";
        case OpCode::Rdm:         return "OpRdm";
        case OpCode::RdmSub:      return "OpRdmSub";
        case OpCode::IpProg:      return "OpIpProg";
        case OpCode::IpProgReply: return "OpIpProgReply";
    }
    return "OpUnknown";
}

std::string formatMac(const std::array<std::uint8_t, 6>& mac) {
    char text[18];
    std::snprintf(text, sizeof(text), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return text;
}

} // namespace lxmonitor::artnet
