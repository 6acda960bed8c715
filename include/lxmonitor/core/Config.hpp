#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lxmonitor::config {

/**
 * @brief Constants that define protocol ports, diagnostic windows and
 * thresholds.
 *
 * Runtime-tunable values (bind address, multicast range, intervals) live in
 * monitor::ListenerConfig; everything here is fixed by the protocols or by
 * the diagnostics the operator UI expects.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t ARTNET_PORT = 6454;
constexpr std::uint16_t SACN_PORT = 5568;
constexpr std::size_t MAX_DATAGRAM_SIZE = 1500;
constexpr std::size_t DMX_UNIVERSE_SIZE = 512;

// Default eager multicast join range. Universes outside it receive no
// multicast delivery unless Listener::joinUniverse() is called.
constexpr std::uint16_t SACN_DEFAULT_FIRST_UNIVERSE = 1;
constexpr std::uint16_t SACN_DEFAULT_LAST_UNIVERSE = 100;

// Source status ---------------------------------------------------------------
constexpr std::chrono::seconds SOURCE_IDLE_AFTER{3};
constexpr std::chrono::seconds SOURCE_STALE_AFTER{10};
constexpr std::chrono::seconds SOURCE_EVICT_AFTER{60};

// Trackers --------------------------------------------------------------------
constexpr std::chrono::seconds FPS_WINDOW{1};
constexpr std::chrono::seconds SEQUENCE_WINDOW{5};
constexpr std::size_t LATENCY_SAMPLE_CAPACITY = 100;

constexpr float FPS_LOW_THRESHOLD = 20.0f;
constexpr float FPS_HIGH_THRESHOLD = 44.0f;

// Periodic tasks --------------------------------------------------------------
constexpr std::chrono::milliseconds SWEEP_INTERVAL{1000};
constexpr std::chrono::milliseconds DISCOVERY_POLL_INTERVAL{10000};
constexpr std::chrono::milliseconds POLL_SEND_TIMEOUT{500};

// Events ----------------------------------------------------------------------
constexpr std::size_t EVENT_BUS_CAPACITY = 1000;

// Capture ---------------------------------------------------------------------
constexpr int CAPTURE_SNAPLEN = 1500;
constexpr int CAPTURE_READ_TIMEOUT_MS = 100; // stop-flag polling granularity

} // namespace lxmonitor::config
