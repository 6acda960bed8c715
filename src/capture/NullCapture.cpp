#include "lxmonitor/capture/NullCapture.hpp"

#include "lxmonitor/core/Error.hpp"

#include <utility>

namespace lxmonitor::capture {

NullCapture::NullCapture(monitor::PacketRouterHandle router)
: CaptureBackend(std::move(router))
{}

NullCapture::~NullCapture() {
    stop(); // ensure thread is joined before destruction
}

expected<void> NullCapture::open(const std::string&) {
    return unexpected(make_error_code(MonitorErrc::CaptureUnavailable));
}

} // namespace lxmonitor::capture
