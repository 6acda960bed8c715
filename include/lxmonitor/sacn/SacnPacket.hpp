#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lxmonitor::sacn {

using Cid = std::array<std::uint8_t, 16>;

/// Framing-layer fields shared by every data packet from one source.
struct SourceInfo {
    Cid cid{};
    std::string sourceName;
    std::uint8_t priority = 100; // 0..200
    std::uint16_t syncAddress = 0;
    std::uint8_t sequence = 0;
    std::uint8_t options = 0;
    std::uint16_t universe = 1;
};

struct SacnDmx {
    SourceInfo source;
    std::uint8_t startCode = 0;
    std::vector<std::uint8_t> data;
};

struct SacnSync {
    std::uint16_t syncAddress = 0;
};

struct SacnDiscovery {
    Cid cid{};
    std::string sourceName;
    std::vector<std::uint16_t> universes;
};

/// Structurally valid E1.31 that we do not classify (other vectors, alternate start codes).
struct SacnUnknown {};

using Packet = std::variant<SacnDmx, SacnSync, SacnDiscovery, SacnUnknown>;

} // namespace lxmonitor::sacn
