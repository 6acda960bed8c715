// SacnProtocol.hpp
// -----------------------------------------------------------------------------
// ANSI E1.31 (streaming ACN) decoding helpers. Stateless; safe from any thread.

#pragma once

#include "lxmonitor/net/NetConfig.hpp"
#include "lxmonitor/sacn/SacnPacket.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lxmonitor::sacn {

constexpr std::uint8_t ACN_PACKET_IDENTIFIER[12] = {
    0x41, 0x53, 0x43, 0x2d, 0x45, 0x31, 0x2e, 0x31, 0x37, 0x00, 0x00, 0x00,
}; // "ASC-E1.17\0\0\0"

constexpr std::uint16_t ACN_PREAMBLE_SIZE = 0x0010;
constexpr std::uint16_t ACN_POSTAMBLE_SIZE = 0x0000;

constexpr std::uint32_t VECTOR_ROOT_E131_DATA = 0x00000004;
constexpr std::uint32_t VECTOR_ROOT_E131_EXTENDED = 0x00000008;
constexpr std::uint32_t VECTOR_E131_DATA_PACKET = 0x00000002;
constexpr std::uint32_t VECTOR_E131_EXTENDED_SYNCHRONIZATION = 0x00000001;
constexpr std::uint32_t VECTOR_E131_EXTENDED_DISCOVERY = 0x00000002;
constexpr std::uint8_t VECTOR_DMP_SET_PROPERTY = 0x02;

constexpr std::size_t ROOT_LAYER_SIZE = 38;
constexpr std::size_t FRAMING_LAYER_END = 115;
constexpr std::size_t DMP_HEADER_END = 126;
constexpr std::size_t DISCOVERY_LIST_OFFSET = 120;

/**
 * @brief Decode one UDP payload.
 *
 * std::nullopt means "not E1.31" (too short, wrong identifier or
 * preamble/postamble sizes) or a data/extended packet truncated inside its
 * fixed header. Unrecognised root vectors, non-SET_PROPERTY DMP layers and
 * DMX with a non-zero start code decode to SacnUnknown. Alternate start codes
 * are deliberately never surfaced as DMX: some consoles interleave them with
 * level data and treating them as levels makes fixtures flicker.
 */
[[nodiscard]] std::optional<Packet> decode(const std::uint8_t* data, std::size_t size);

[[nodiscard]] inline std::optional<Packet> decode(const std::vector<std::uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

/// 239.255.<universe high byte>.<universe low byte>
[[nodiscard]] net::address_v4 multicastAddress(std::uint16_t universe);

/// Lowercase 8-4-4-4-12 hex rendering of a CID.
[[nodiscard]] std::string cidToString(const Cid& cid);

[[nodiscard]] bool isZeroCid(const Cid& cid);

} // namespace lxmonitor::sacn
