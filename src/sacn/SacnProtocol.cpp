#include "lxmonitor/sacn/SacnProtocol.hpp"

#include "lxmonitor/core/ByteOrder.hpp"
#include "lxmonitor/core/Config.hpp"
#include "lxmonitor/log/Log.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace lxmonitor::sacn {
namespace {

using core::readFixedString;
using core::readUInt16Be;
using core::readUInt32Be;

std::optional<Packet> decodeDataPacket(const std::uint8_t* data, std::size_t size, const Cid& cid) {
    if (size < FRAMING_LAYER_END) {
        return std::nullopt;
    }

    const std::uint32_t framingVector = readUInt32Be(data + 40);

    SourceInfo source;
    source.cid = cid;
    source.sourceName = readFixedString(data + 44, 64);
    source.priority = data[108];
    source.syncAddress = readUInt16Be(data + 109);
    source.sequence = data[111];
    source.options = data[112];
    source.universe = readUInt16Be(data + 113);

    if (framingVector == VECTOR_E131_EXTENDED_SYNCHRONIZATION) {
        return Packet{SacnSync{source.syncAddress}};
    }

    if (size < DMP_HEADER_END) {
        return std::nullopt;
    }
    if (data[117] != VECTOR_DMP_SET_PROPERTY) {
        return Packet{SacnUnknown{}};
    }

    const std::uint16_t propertyCount = readUInt16Be(data + 123);
    const std::uint8_t startCode = data[125];
    if (startCode != 0) {
        logDebug("[sACN] ignoring start code 0x", std::hex, static_cast<int>(startCode), std::dec,
                 " (universe ", source.universe, ", priority ", static_cast<int>(source.priority), ")\n");
        return Packet{SacnUnknown{}};
    }

    const std::size_t declared = propertyCount > 0 ? propertyCount - 1u : 0u;
    const std::size_t length = std::min({declared, config::DMX_UNIVERSE_SIZE, size - DMP_HEADER_END});

    SacnDmx dmx;
    dmx.source = std::move(source);
    dmx.startCode = startCode;
    dmx.data.assign(data + DMP_HEADER_END, data + DMP_HEADER_END + length);
    return Packet{std::move(dmx)};
}

std::optional<Packet> decodeExtendedPacket(const std::uint8_t* data, std::size_t size, const Cid& cid) {
    if (size < DISCOVERY_LIST_OFFSET) {
        return std::nullopt;
    }
    if (readUInt32Be(data + 40) != VECTOR_E131_EXTENDED_DISCOVERY) {
        return Packet{SacnUnknown{}};
    }

    SacnDiscovery discovery;
    discovery.cid = cid;
    discovery.sourceName = readFixedString(data + 44, 64);

    for (std::size_t offset = DISCOVERY_LIST_OFFSET; offset + 1 < size; offset += 2) {
        const std::uint16_t universe = readUInt16Be(data + offset);
        if (universe != 0) {
            discovery.universes.push_back(universe);
        }
    }
    return Packet{std::move(discovery)};
}

} // namespace

std::optional<Packet> decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < ROOT_LAYER_SIZE) {
        return std::nullopt;
    }
    if (std::memcmp(data + 4, ACN_PACKET_IDENTIFIER, sizeof(ACN_PACKET_IDENTIFIER)) != 0) {
        return std::nullopt;
    }
    if (readUInt16Be(data) != ACN_PREAMBLE_SIZE || readUInt16Be(data + 2) != ACN_POSTAMBLE_SIZE) {
        return std::nullopt;
    }

    Cid cid{};
    std::copy(data + 22, data + 38, cid.begin());

    switch (readUInt32Be(data + 18)) {
        case VECTOR_ROOT_E131_DATA:
            return decodeDataPacket(data, size, cid);
        case VECTOR_ROOT_E131_EXTENDED:
            return decodeExtendedPacket(data, size, cid);
        default:
            return Packet{SacnUnknown{}};
    }
}

net::address_v4 multicastAddress(std::uint16_t universe) {
    return net::address_v4(net::address_v4::bytes_type{
        239, 255,
        static_cast<unsigned char>(universe >> 8),
        static_cast<unsigned char>(universe & 0xFFu)});
}

std::string cidToString(const Cid& cid) {
    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  cid[0], cid[1], cid[2], cid[3],
                  cid[4], cid[5],
                  cid[6], cid[7],
                  cid[8], cid[9],
                  cid[10], cid[11], cid[12], cid[13], cid[14], cid[15]);
    return text;
}

bool isZeroCid(const Cid& cid) {
    return std::all_of(cid.begin(), cid.end(), [](std::uint8_t b) { return b == 0; });
}

} // namespace lxmonitor::sacn
