#pragma once

#include "lxmonitor/artnet/ArtNetPacket.hpp"
#include "lxmonitor/monitor/DmxStore.hpp"
#include "lxmonitor/monitor/ListenerEvent.hpp"
#include "lxmonitor/monitor/SourceRegistry.hpp"
#include "lxmonitor/net/NetConfig.hpp"
#include "lxmonitor/sacn/SacnPacket.hpp"

#include <memory>

namespace lxmonitor::monitor {

/**
 * @brief Applies decoded packets to the registry, the frame store and the
 * event bus.
 *
 * Socket listeners only know the sender. Captured frames also carry the
 * destination, which lets the router record unicast receivers (fixtures)
 * that never transmit anything a socket could see.
 *
 * Registry and store updates are separate lock acquisitions; the router
 * holds no lock of its own and may be called from several threads at once.
 */
class PacketRouter {
public:
    PacketRouter(SourceRegistryHandle registry,
                 DmxStoreHandle store,
                 ListenerEventBusHandle events);

    void routeArtNet(const artnet::Packet& packet, const net::address_v4& sender);
    void routeSacn(const sacn::Packet& packet, const net::address_v4& sender);

    void routeCapturedArtNet(const artnet::Packet& packet,
                             const net::address_v4& source,
                             const net::address_v4& destination);
    void routeCapturedSacn(const sacn::Packet& packet,
                           const net::address_v4& source,
                           const net::address_v4& destination);

    const SourceRegistryHandle& registry() const { return registry_; }
    const DmxStoreHandle& store() const { return store_; }
    const ListenerEventBusHandle& events() const { return events_; }

    /// Limited broadcast or multicast: not a single receiver.
    static bool isGroupAddress(const net::address_v4& address);

private:
    void publishFrame(std::uint16_t universe, const net::address_v4& sender, const DmxFrame& data);
    void publishSourcesChanged();

    SourceRegistryHandle registry_;
    DmxStoreHandle store_;
    ListenerEventBusHandle events_;
};

using PacketRouterHandle = std::shared_ptr<PacketRouter>;

} // namespace lxmonitor::monitor
