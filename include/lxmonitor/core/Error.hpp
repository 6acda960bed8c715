#pragma once

#include <system_error>

namespace lxmonitor {

/**
 * @brief Configuration errors rejected at the command boundary.
 *
 * These never mutate state: the request is refused before anything starts.
 * Resource failures (bind, multicast join, capture open) keep whatever
 * std::error_code asio or libpcap produced.
 */
enum class MonitorErrc {
    CaptureUnavailable = 1,
    UnknownInterface,
    CaptureAlreadyRunning,
    NoCaptureInterfaces,
    CaptureOpenFailed,
    CaptureFilterFailed,
};

const std::error_category& monitorCategory() noexcept;

std::error_code make_error_code(MonitorErrc e) noexcept;

} // namespace lxmonitor

namespace std {
template <>
struct is_error_code_enum<lxmonitor::MonitorErrc> : true_type {};
} // namespace std
