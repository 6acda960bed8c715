#include "lxmonitor/monitor/PacketRouter.hpp"

#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/core/Overloaded.hpp"
#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/sacn/SacnProtocol.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace lxmonitor::monitor {
namespace {

std::uint64_t wallClockMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

ArtNetObservation pollReplyObservation(const artnet::ArtPollReply& reply, SourceDirection direction) {
    ArtNetObservation observation;
    observation.ip = net::address_v4(reply.ipAddress).to_string();
    observation.shortName = reply.shortName;
    observation.longName = reply.longName;
    const bool hasMac = std::any_of(reply.macAddress.begin(), reply.macAddress.end(),
                                    [](std::uint8_t b) { return b != 0; });
    if (hasMac) {
        observation.mac = reply.macAddress;
    }
    observation.universes = reply.outputUniverses();
    observation.direction = direction;
    return observation;
}

ArtNetObservation dmxObservation(const artnet::ArtDmx& dmx,
                                 const net::address_v4& ip,
                                 SourceDirection direction,
                                 bool withSequence) {
    ArtNetObservation observation;
    observation.ip = ip.to_string();
    observation.universes = {dmx.universe};
    observation.direction = direction;
    if (withSequence) {
        observation.sequence = dmx.sequence;
    }
    return observation;
}

SacnObservation senderObservation(const sacn::SacnDmx& dmx, const net::address_v4& ip) {
    SacnObservation observation;
    observation.ip = ip.to_string();
    observation.sourceName = dmx.source.sourceName;
    observation.cid = dmx.source.cid;
    observation.priority = dmx.source.priority;
    observation.universes = {dmx.source.universe};
    observation.direction = SourceDirection::Sending;
    observation.sequence = dmx.source.sequence;
    return observation;
}

} // namespace

PacketRouter::PacketRouter(SourceRegistryHandle registry,
                           DmxStoreHandle store,
                           ListenerEventBusHandle events)
: registry_(std::move(registry))
, store_(std::move(store))
, events_(std::move(events))
{}

bool PacketRouter::isGroupAddress(const net::address_v4& address) {
    // A directed broadcast depends on the netmask, which a captured frame does
    // not carry; on a /8 Art-Net network x.x.x.255 is an ordinary host.
    return address.is_multicast() || address == net::address_v4::broadcast();
}

void PacketRouter::publishFrame(std::uint16_t universe, const net::address_v4& sender, const DmxFrame& data) {
    events_->publish(FrameUpdated{universe, sender.to_string(), wallClockMs(), data});
}

void PacketRouter::publishSourcesChanged() {
    events_->publish(SourcesChanged{});
}

void PacketRouter::routeArtNet(const artnet::Packet& packet, const net::address_v4& sender) {
    std::visit(overloaded{
        [&](const artnet::ArtPollReply& reply) {
            registry_->updateArtNet(pollReplyObservation(reply, SourceDirection::Unknown));
            publishSourcesChanged();
        },
        [&](const artnet::ArtDmx& dmx) {
            registry_->updateArtNet(dmxObservation(dmx, sender, SourceDirection::Sending, true));
            store_->update(dmx.universe, dmx.data);
            publishFrame(dmx.universe, sender, dmx.data);
        },
        [](const artnet::ArtPoll&) {
            // Monitor only: polls from controllers are not answered.
        },
        [&](const artnet::ArtOther& other) {
            logDebug("[Art-Net] ignoring ", artnet::opcodeName(other.opcode),
                     " from ", sender.to_string(), "\n");
        },
    }, packet);
}

void PacketRouter::routeSacn(const sacn::Packet& packet, const net::address_v4& sender) {
    std::visit(overloaded{
        [&](const sacn::SacnDmx& dmx) {
            registry_->updateSacn(senderObservation(dmx, sender));
            store_->update(dmx.source.universe, dmx.data);
            publishFrame(dmx.source.universe, sender, dmx.data);
        },
        [&](const sacn::SacnDiscovery& discovery) {
            SacnObservation observation;
            observation.ip = sender.to_string();
            observation.sourceName = discovery.sourceName;
            observation.cid = discovery.cid;
            observation.priority = 100;
            observation.universes = discovery.universes;
            registry_->updateSacn(observation);
            publishSourcesChanged();
        },
        [](const sacn::SacnSync&) {},
        [](const sacn::SacnUnknown&) {},
    }, packet);
}

void PacketRouter::routeCapturedArtNet(const artnet::Packet& packet,
                                       const net::address_v4& source,
                                       const net::address_v4& destination) {
    std::visit(overloaded{
        [&](const artnet::ArtDmx& dmx) {
            registry_->updateArtNet(dmxObservation(dmx, source, SourceDirection::Sending, true));
            if (!isGroupAddress(destination)) {
                registry_->updateArtNet(dmxObservation(dmx, destination, SourceDirection::Receiving, false));
            }
            store_->update(dmx.universe, dmx.data);
            publishFrame(dmx.universe, source, dmx.data);
        },
        [&](const artnet::ArtPollReply& reply) {
            // A node answering a poll is a node that outputs DMX.
            registry_->updateArtNet(pollReplyObservation(reply, SourceDirection::Receiving));
            publishSourcesChanged();
        },
        [](const artnet::ArtPoll&) {},
        [](const artnet::ArtOther&) {},
    }, packet);
}

void PacketRouter::routeCapturedSacn(const sacn::Packet& packet,
                                     const net::address_v4& source,
                                     const net::address_v4& destination) {
    std::visit(overloaded{
        [&](const sacn::SacnDmx& dmx) {
            registry_->updateSacn(senderObservation(dmx, source));
            if (!isGroupAddress(destination)) {
                SacnObservation receiver;
                receiver.ip = destination.to_string();
                receiver.universes = {dmx.source.universe};
                receiver.direction = SourceDirection::Receiving;
                registry_->updateSacn(receiver);
            }
            store_->update(dmx.source.universe, dmx.data);
            publishFrame(dmx.source.universe, source, dmx.data);
        },
        [](const sacn::SacnDiscovery&) {},
        [](const sacn::SacnSync&) {},
        [](const sacn::SacnUnknown&) {},
    }, packet);
}

} // namespace lxmonitor::monitor
