#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lxmonitor::artnet {

enum class OpCode : std::uint16_t {
    Poll = 0x2000,
    PollReply = 0x2100,
    Dmx = 0x5000,
    Nzs = 0x5100,
    Sync = 0x5200,
    Address = 0x6000,
    Input = 0x7000,
    TodRequest = 0x8000,
    TodData = 0x8100,
    TodControl = 0x8200,
    Rdm = 0x8300,
    RdmSub = 0x8400,
    IpProg = 0xF800,
    IpProgReply = 0xF900,
};

/// Name of a known opcode, or "OpUnknown".
const char* opcodeName(std::uint16_t opcode);

struct ArtPoll {};

struct ArtPollReply {
    std::array<std::uint8_t, 4> ipAddress{};
    std::uint16_t port = 0;
    std::uint16_t versionInfo = 0;
    std::uint8_t netSwitch = 0;
    std::uint8_t subSwitch = 0;
    std::uint16_t oem = 0;
    std::uint8_t ubeaVersion = 0;
    std::uint8_t status1 = 0;
    std::uint16_t estaManufacturer = 0;
    std::string shortName;
    std::string longName;
    std::string nodeReport;
    std::uint16_t numPorts = 0;
    std::array<std::uint8_t, 4> portTypes{};
    std::array<std::uint8_t, 4> goodInput{};
    std::array<std::uint8_t, 4> goodOutput{};
    std::array<std::uint8_t, 4> swIn{};
    std::array<std::uint8_t, 4> swOut{};

    // Trailing fields; zero when the reply was too short to carry them.
    std::uint8_t style = 0;
    std::array<std::uint8_t, 6> macAddress{};
    std::array<std::uint8_t, 4> bindIp{};
    std::uint8_t bindIndex = 0;
    std::uint8_t status2 = 0;

    /// 15-bit universes of the output ports the node advertises.
    std::vector<std::uint16_t> outputUniverses() const;
};

struct ArtDmx {
    std::uint8_t sequence = 0;
    std::uint8_t physical = 0;
    std::uint16_t universe = 0; // Net in the high byte, SubUni in the low byte
    std::uint16_t length = 0;   // as declared on the wire
    std::vector<std::uint8_t> data;
};

struct ArtOther {
    std::uint16_t opcode = 0;
};

using Packet = std::variant<ArtPoll, ArtPollReply, ArtDmx, ArtOther>;

} // namespace lxmonitor::artnet
