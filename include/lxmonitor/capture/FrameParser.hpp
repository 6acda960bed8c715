#pragma once

#include "lxmonitor/net/NetConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace lxmonitor::capture {

constexpr std::size_t ETHERNET_HEADER_SIZE = 14;
constexpr std::size_t IPV4_MIN_HEADER_SIZE = 20;
constexpr std::size_t UDP_HEADER_SIZE = 8;
constexpr std::size_t MIN_FRAME_SIZE = ETHERNET_HEADER_SIZE + IPV4_MIN_HEADER_SIZE + UDP_HEADER_SIZE;
constexpr std::uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr std::uint8_t IP_PROTOCOL_UDP = 17;

/// UDP datagram recovered from a captured Ethernet frame. `payload` points
/// into the frame buffer and is only valid as long as that buffer is.
struct CapturedDatagram {
    net::address_v4 source;
    net::address_v4 destination;
    std::uint16_t sourcePort = 0;
    std::uint16_t destinationPort = 0;
    const std::uint8_t* payload = nullptr;
    std::size_t payloadSize = 0;
};

/**
 * @brief Peel Ethernet, IPv4 and UDP headers off a raw frame.
 *
 * Anything that is not IPv4/UDP, or is too short for the headers it claims,
 * yields std::nullopt. VLAN tags and IP options beyond IHL are not
 * interpreted.
 */
[[nodiscard]] std::optional<CapturedDatagram> parseFrame(const std::uint8_t* frame, std::size_t size);

} // namespace lxmonitor::capture
