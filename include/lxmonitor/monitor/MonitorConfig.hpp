#pragma once

#include "lxmonitor/core/Config.hpp"
#include "lxmonitor/net/NetConfig.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lxmonitor::monitor {

struct ListenerConfig {
    net::address_v4 bindAddress = net::address_v4::any();

    bool listenArtNet = true;
    bool listenSacn = true;

    // 0 binds an ephemeral port; Listener reports the one it got.
    std::uint16_t artnetPort = config::ARTNET_PORT;
    std::uint16_t sacnPort = config::SACN_PORT;

    // Eager multicast joins; an empty range (first > last) joins nothing.
    std::uint16_t multicastFirstUniverse = config::SACN_DEFAULT_FIRST_UNIVERSE;
    std::uint16_t multicastLastUniverse = config::SACN_DEFAULT_LAST_UNIVERSE;

    bool periodicPoll = true;
    net::address_v4 pollAddress = net::address_v4::broadcast();
    std::uint16_t pollPort = config::ARTNET_PORT;
    std::chrono::milliseconds pollInterval = config::DISCOVERY_POLL_INTERVAL;
    std::chrono::milliseconds pollSendTimeout = config::POLL_SEND_TIMEOUT;

    std::chrono::milliseconds sweepInterval = config::SWEEP_INTERVAL;
};

struct MonitorConfig {
    ListenerConfig listener;
    std::size_t eventCapacity = config::EVENT_BUS_CAPACITY;

    // Start promiscuous capture on this interface right after startup.
    std::optional<std::string> captureInterface;

    bool debugLogging = false;
};

} // namespace lxmonitor::monitor
