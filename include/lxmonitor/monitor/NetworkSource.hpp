#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lxmonitor::monitor {

enum class Protocol : std::uint8_t {
    ArtNet,
    Sacn,
};

enum class SourceStatus : std::uint8_t {
    Active, // traffic within the last 3 s
    Idle,   // 3..10 s of silence
    Stale,  // 10 s or more
};

/**
 * Only ever escalates: Unknown -> Sending/Receiving -> Both.
 */
enum class SourceDirection : std::uint8_t {
    Unknown,
    Sending,
    Receiving,
    Both,
};

enum class FpsWarning : std::uint8_t {
    None,
    Low,
    High,
};

const char* toString(Protocol protocol);
const char* toString(SourceStatus status);
const char* toString(SourceDirection direction);
const char* toString(FpsWarning warning); // "" for None, "low", "high"

/// Join of the current direction with a new observation.
SourceDirection escalate(SourceDirection current, SourceDirection observed);

/// Pure function of silence duration in milliseconds.
SourceStatus statusForSilence(long long silenceMs);

FpsWarning fpsWarningFor(float fps);

/**
 * @brief Snapshot of one device seen on the network.
 *
 * Values are copies; the registry owns the live state and the trackers
 * behind these numbers.
 */
struct NetworkSource {
    std::string id;
    std::string ip;
    std::string name;
    Protocol protocol = Protocol::ArtNet;
    std::vector<std::uint16_t> universes; // sorted, unique
    SourceStatus status = SourceStatus::Active;
    SourceDirection direction = SourceDirection::Unknown;
    float fps = 0.0f;

    std::uint64_t packetCount = 0;
    std::uint64_t firstSeenMs = 0; // Unix epoch milliseconds
    std::uint64_t lastSeenMs = 0;

    float packetLossPercent = 0.0f;
    FpsWarning fpsWarning = FpsWarning::None;
    std::vector<std::uint16_t> duplicateUniverses;
    float latencyJitterMs = 0.0f;

    // Art-Net
    std::optional<std::string> artnetShortName;
    std::optional<std::string> artnetLongName;
    std::optional<std::string> macAddress;

    // sACN
    std::optional<std::string> sacnCid;
    std::optional<std::uint8_t> sacnPriority;
};

} // namespace lxmonitor::monitor
