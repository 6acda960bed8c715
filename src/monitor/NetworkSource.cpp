#include "lxmonitor/monitor/NetworkSource.hpp"

#include "lxmonitor/core/Config.hpp"

#include <chrono>

namespace lxmonitor::monitor {

const char* toString(Protocol protocol) {
    switch (protocol) {
        case Protocol::ArtNet: return "artnet";
        case Protocol::Sacn:   return "sACN";
    }
    return "unknown";
}

const char* toString(SourceStatus status) {
    switch (status) {
        case SourceStatus::Active: return "active";
        case SourceStatus::Idle:   return "idle";
        case SourceStatus::Stale:  return "stale";
    }
    return "unknown";
}

const char* toString(SourceDirection direction) {
    switch (direction) {
        case SourceDirection::Unknown:   return "unknown";
        case SourceDirection::Sending:   return "sending";
        case SourceDirection::Receiving: return "receiving";
        case SourceDirection::Both:      return "both";
    }
    return "unknown";
}

const char* toString(FpsWarning warning) {
    switch (warning) {
        case FpsWarning::None: return "";
        case FpsWarning::Low:  return "low";
        case FpsWarning::High: return "high";
    }
    return "";
}

SourceDirection escalate(SourceDirection current, SourceDirection observed) {
    if (observed == SourceDirection::Unknown || observed == current) {
        return current;
    }
    if (current == SourceDirection::Unknown) {
        return observed;
    }
    return SourceDirection::Both;
}

SourceStatus statusForSilence(long long silenceMs) {
    using std::chrono::milliseconds;
    if (silenceMs < milliseconds(config::SOURCE_IDLE_AFTER).count()) {
        return SourceStatus::Active;
    }
    if (silenceMs < milliseconds(config::SOURCE_STALE_AFTER).count()) {
        return SourceStatus::Idle;
    }
    return SourceStatus::Stale;
}

FpsWarning fpsWarningFor(float fps) {
    if (fps > 0.0f && fps < config::FPS_LOW_THRESHOLD) {
        return FpsWarning::Low;
    }
    if (fps > config::FPS_HIGH_THRESHOLD) {
        return FpsWarning::High;
    }
    return FpsWarning::None;
}

} // namespace lxmonitor::monitor
