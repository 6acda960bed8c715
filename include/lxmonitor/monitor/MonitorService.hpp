#pragma once

#include "lxmonitor/capture/CaptureBackend.hpp"
#include "lxmonitor/core/Expected.hpp"
#include "lxmonitor/monitor/DmxStore.hpp"
#include "lxmonitor/monitor/Listener.hpp"
#include "lxmonitor/monitor/ListenerEvent.hpp"
#include "lxmonitor/monitor/MonitorConfig.hpp"
#include "lxmonitor/monitor/NetworkSource.hpp"
#include "lxmonitor/monitor/PacketRouter.hpp"
#include "lxmonitor/monitor/SourceRegistry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lxmonitor::monitor {

/**
 * @brief Query/command surface over the whole monitor.
 *
 * Owns the shared registry, frame store and event bus, the socket listener
 * and the capture backend. Queries return snapshots and never block on I/O;
 * commands return expected<void> and leave state untouched when refused.
 */
class MonitorService {
public:
    using CaptureFactory = std::function<capture::CaptureBackendHandle(PacketRouterHandle)>;

    explicit MonitorService(MonitorConfig config = {});
    MonitorService(MonitorConfig config, CaptureFactory captureFactory);
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    /// Start listening; also starts capture when the config names an interface.
    void start();
    void stop();

    std::vector<NetworkSource> sources() const;
    std::optional<DmxFrame> frame(std::uint16_t universe) const;
    std::map<std::uint16_t, DmxFrame> frames() const;

    ListenerStatus listenerStatus() const;
    capture::CaptureStatus captureStatus() const;
    std::vector<capture::CaptureInterface> captureInterfaces() const;

    /**
     * @brief Turn promiscuous capture on or off.
     *
     * Enabling without an interface picks the first one the driver lists.
     * Disabling is always accepted.
     */
    expected<void> setCaptureEnabled(bool enabled,
                                     std::optional<std::string> interfaceName = std::nullopt);

    expected<void> sendDiscoveryPoll();
    void joinUniverse(std::uint16_t universe);

    ListenerEventBus::Subscription subscribe();

    const PacketRouterHandle& router() const { return router_; }

private:
    MonitorConfig config_;
    SourceRegistryHandle registry_;
    DmxStoreHandle store_;
    ListenerEventBusHandle events_;
    PacketRouterHandle router_;
    ListenerHandle listener_;
    capture::CaptureBackendHandle capture_;
};

} // namespace lxmonitor::monitor
