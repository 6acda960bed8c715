// ArtNetProtocol.hpp
// -----------------------------------------------------------------------------
// Art-Net 4 wire format helpers.
// Responsibilities:
//   * Classify raw datagrams into the closed artnet::Packet variant.
//   * Build the ArtPoll discovery request.
//   * Pack Net/Sub-Net/Universe switches into a 15-bit port address.
// Everything here is stateless and safe to call from any thread.

#pragma once

#include "lxmonitor/artnet/ArtNetPacket.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lxmonitor::artnet {

constexpr char ARTNET_ID[8] = {'A', 'r', 't', '-', 'N', 'e', 't', '\0'};
constexpr std::size_t ARTNET_MIN_PACKET_SIZE = 12;
constexpr std::size_t ARTNET_POLL_REPLY_MIN_SIZE = 207;
constexpr std::size_t ARTNET_DMX_HEADER_SIZE = 18;
constexpr std::size_t ARTNET_POLL_SIZE = 14;
constexpr std::uint16_t ARTNET_PROTOCOL_VERSION = 14;

// ArtPoll TalkToMe: bit 1 asks nodes to reply whenever their state changes.
constexpr std::uint8_t ARTPOLL_FLAG_REPLY_ON_CHANGE = 0x02;
constexpr std::uint8_t ARTPOLL_DIAG_PRIORITY_LOW = 0x10;

// PortTypes bit 7: the port can output DMX from the network.
constexpr std::uint8_t PORT_TYPE_OUTPUT = 0x80;

/**
 * @brief Decode one UDP payload.
 *
 * Returns std::nullopt for anything that is not structurally an Art-Net
 * packet: shorter than 12 bytes, wrong ID, or a PollReply/Dmx truncated below
 * its fixed fields. Unrecognised opcodes are valid packets and come back as
 * ArtOther.
 */
[[nodiscard]] std::optional<Packet> decode(const std::uint8_t* data, std::size_t size);

[[nodiscard]] inline std::optional<Packet> decode(const std::vector<std::uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

/// 14-byte ArtPoll: ID, OpPoll, protocol 14, reply-on-change, low diagnostics priority.
[[nodiscard]] std::vector<std::uint8_t> encodePoll();

[[nodiscard]] constexpr std::uint16_t calculateUniverse(std::uint8_t net,
                                                       std::uint8_t subnet,
                                                       std::uint8_t universe) {
    return static_cast<std::uint16_t>(((net & 0x7Fu) << 8)
                                    | ((subnet & 0x0Fu) << 4)
                                    |  (universe & 0x0Fu));
}

/// "AA:BB:CC:DD:EE:FF"
std::string formatMac(const std::array<std::uint8_t, 6>& mac);

} // namespace lxmonitor::artnet
