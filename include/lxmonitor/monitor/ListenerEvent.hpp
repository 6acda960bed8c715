#pragma once

#include "lxmonitor/monitor/DmxStore.hpp"
#include "lxmonitor/monitor/EventBus.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace lxmonitor::monitor {

/// The source table changed; observers re-fetch the snapshot.
struct SourcesChanged {};

struct FrameUpdated {
    std::uint16_t universe = 0;
    std::string sourceIp;
    std::uint64_t timestampMs = 0; // Unix epoch milliseconds
    DmxFrame data;
};

using ListenerEvent = std::variant<SourcesChanged, FrameUpdated>;
using ListenerEventBus = EventBus<ListenerEvent>;
using ListenerEventBusHandle = std::shared_ptr<ListenerEventBus>;

} // namespace lxmonitor::monitor
