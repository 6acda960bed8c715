#include "lxmonitor/capture/FrameParser.hpp"

#include "lxmonitor/core/ByteOrder.hpp"

namespace lxmonitor::capture {

std::optional<CapturedDatagram> parseFrame(const std::uint8_t* frame, std::size_t size) {
    if (frame == nullptr || size < MIN_FRAME_SIZE) {
        return std::nullopt;
    }
    if (core::readUInt16Be(frame + 12) != ETHERTYPE_IPV4) {
        return std::nullopt;
    }

    const std::uint8_t* ip = frame + ETHERNET_HEADER_SIZE;
    if ((ip[0] >> 4) != 4) {
        return std::nullopt;
    }
    const std::size_t ihl = static_cast<std::size_t>(ip[0] & 0x0F) * 4;
    if (ihl < IPV4_MIN_HEADER_SIZE || ETHERNET_HEADER_SIZE + ihl > size) {
        return std::nullopt;
    }
    if (ip[9] != IP_PROTOCOL_UDP) {
        return std::nullopt;
    }

    const std::size_t udpStart = ETHERNET_HEADER_SIZE + ihl;
    if (udpStart + UDP_HEADER_SIZE > size) {
        return std::nullopt;
    }
    const std::uint8_t* udp = frame + udpStart;

    CapturedDatagram datagram;
    datagram.source = net::address_v4(net::address_v4::bytes_type{ip[12], ip[13], ip[14], ip[15]});
    datagram.destination = net::address_v4(net::address_v4::bytes_type{ip[16], ip[17], ip[18], ip[19]});
    datagram.sourcePort = core::readUInt16Be(udp);
    datagram.destinationPort = core::readUInt16Be(udp + 2);
    datagram.payload = udp + UDP_HEADER_SIZE;
    datagram.payloadSize = size - (udpStart + UDP_HEADER_SIZE);
    return datagram;
}

} // namespace lxmonitor::capture
