#include "lxmonitor/monitor/MonitorService.hpp"

#include "lxmonitor/core/Error.hpp"
#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/net/NetService.hpp"

#include <utility>

namespace lxmonitor::monitor {

MonitorService::MonitorService(MonitorConfig config)
: MonitorService(std::move(config), &capture::makeCaptureBackend)
{}

MonitorService::MonitorService(MonitorConfig config, CaptureFactory captureFactory)
: config_(std::move(config))
, registry_(std::make_shared<SourceRegistry>())
, store_(std::make_shared<DmxStore>())
, events_(std::make_shared<ListenerEventBus>(config_.eventCapacity))
, router_(std::make_shared<PacketRouter>(registry_, store_, events_))
{
    if (config_.debugLogging) {
        setDebugLogging(true);
    }
    listener_ = Listener::create(net::shared_io_context(), config_.listener, router_);
    capture_ = captureFactory(router_);
}

MonitorService::~MonitorService() {
    stop();
    events_->close();
}

void MonitorService::start() {
    listener_->start();

    if (config_.captureInterface) {
        if (auto started = setCaptureEnabled(true, config_.captureInterface); !started) {
            logError("[Capture] cannot start on ", *config_.captureInterface, ": ",
                     started.error().message(), "\n");
        }
    }
}

void MonitorService::stop() {
    capture_->stop();
    listener_->stop();
}

std::vector<NetworkSource> MonitorService::sources() const {
    return registry_->sources();
}

std::optional<DmxFrame> MonitorService::frame(std::uint16_t universe) const {
    return store_->get(universe);
}

std::map<std::uint16_t, DmxFrame> MonitorService::frames() const {
    return store_->getAll();
}

ListenerStatus MonitorService::listenerStatus() const {
    return listener_->status();
}

capture::CaptureStatus MonitorService::captureStatus() const {
    return capture_->status();
}

std::vector<capture::CaptureInterface> MonitorService::captureInterfaces() const {
    return capture_->interfaces();
}

expected<void> MonitorService::setCaptureEnabled(bool enabled, std::optional<std::string> interfaceName) {
    if (!enabled) {
        capture_->stop();
        return {};
    }

    if (!capture_->available()) {
        return unexpected(make_error_code(MonitorErrc::CaptureUnavailable));
    }
    if (capture_->isRunning()) {
        return unexpected(make_error_code(MonitorErrc::CaptureAlreadyRunning));
    }

    if (!interfaceName) {
        const auto known = capture_->interfaces();
        if (known.empty()) {
            return unexpected(make_error_code(MonitorErrc::NoCaptureInterfaces));
        }
        interfaceName = known.front().name;
    }
    return capture_->start(*interfaceName);
}

expected<void> MonitorService::sendDiscoveryPoll() {
    return listener_->sendDiscoveryPoll();
}

void MonitorService::joinUniverse(std::uint16_t universe) {
    listener_->joinUniverse(universe);
}

ListenerEventBus::Subscription MonitorService::subscribe() {
    return events_->subscribe();
}

} // namespace lxmonitor::monitor
