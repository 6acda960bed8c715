#include "lxmonitor/capture/CaptureBackend.hpp"

#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/capture/FrameParser.hpp"
#include "lxmonitor/core/Config.hpp"
#include "lxmonitor/core/Error.hpp"
#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/sacn/SacnProtocol.hpp"

#include <algorithm>
#include <utility>

namespace lxmonitor::capture {

CaptureBackend::CaptureBackend(monitor::PacketRouterHandle router_)
: router(std::move(router_))
{}

CaptureBackend::~CaptureBackend() {
    // Derived classes have already stopped and closed; this only joins a
    // worker that somehow outlived them.
    running = false;
    if (worker.joinable()) {
        worker.join();
    }
}

expected<void> CaptureBackend::start(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    if (!available()) {
        return unexpected(make_error_code(MonitorErrc::CaptureUnavailable));
    }
    if (running) {
        return unexpected(make_error_code(MonitorErrc::CaptureAlreadyRunning));
    }

    const auto known = interfaces();
    const bool found = std::any_of(known.begin(), known.end(),
                                   [&](const CaptureInterface& i) { return i.name == name; });
    if (!found) {
        return unexpected(make_error_code(MonitorErrc::UnknownInterface));
    }

    // A worker that ended on its own (capture error) is still joinable.
    if (worker.joinable()) {
        worker.join();
        close();
    }

    if (auto opened = open(name); !opened) {
        return opened;
    }

    {
        std::lock_guard<std::mutex> lk(stateMutex);
        interfaceName = name;
        lastError.reset();
    }
    enabled = true;
    running = true;
    logInfo("[Capture] started on ", name, "\n");

    worker = std::thread([this] {
        this->run(); // derived loop
        running = false;
        enabled = false;
    });
    return {};
}

void CaptureBackend::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    running = false;
    if (worker.joinable()) {
        worker.join();
        close();
        logInfo("[Capture] stopped after ", packetsCaptured.load(), " frames\n");
    }
    enabled = false;
}

CaptureStatus CaptureBackend::status() const {
    CaptureStatus s;
    s.enabled = enabled;
    s.driverAvailable = available();
    s.packetsCaptured = packetsCaptured;
    std::lock_guard<std::mutex> lk(stateMutex);
    s.interface = interfaceName;
    s.lastError = lastError;
    return s;
}

void CaptureBackend::setLastError(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lk(stateMutex);
    lastError = std::move(message);
}

void CaptureBackend::fail(const std::string& message) {
    logError("[Capture] ", message, "\n");
    setLastError(message);
    enabled = false;
    running = false;
}

void CaptureBackend::handleFrame(const std::uint8_t* frame, std::size_t size) {
    ++packetsCaptured;

    auto datagram = parseFrame(frame, size);
    if (!datagram) {
        return;
    }

    const bool isArtNet = datagram->sourcePort == config::ARTNET_PORT
                       || datagram->destinationPort == config::ARTNET_PORT;
    const bool isSacn = datagram->sourcePort == config::SACN_PORT
                     || datagram->destinationPort == config::SACN_PORT;

    if (isArtNet) {
        if (auto packet = artnet::decode(datagram->payload, datagram->payloadSize)) {
            router->routeCapturedArtNet(*packet, datagram->source, datagram->destination);
        }
    } else if (isSacn) {
        if (auto packet = sacn::decode(datagram->payload, datagram->payloadSize)) {
            router->routeCapturedSacn(*packet, datagram->source, datagram->destination);
        }
    }
}

} // namespace lxmonitor::capture
