#include "lxmonitor/monitor/Listener.hpp"

#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/sacn/SacnProtocol.hpp"

#include <algorithm>
#include <future>
#include <utility>

namespace lxmonitor::monitor {

namespace {
constexpr std::chrono::milliseconds STOP_WAIT{1000};
constexpr std::chrono::milliseconds RETRY_FIRST{100};
constexpr std::chrono::milliseconds RETRY_MAX{1000};
}

std::shared_ptr<Listener> Listener::create(std::shared_ptr<net::asio::io_context> io,
                                           ListenerConfig config,
                                           PacketRouterHandle router) {
    return std::make_shared<Listener>(CreateTag{}, std::move(io), std::move(config), std::move(router));
}

Listener::Listener(CreateTag,
                   std::shared_ptr<net::asio::io_context> io_,
                   ListenerConfig config_,
                   PacketRouterHandle router_)
: io(std::move(io_))
, config(std::move(config_))
, router(std::move(router_))
, artnetChannel(*io, "[Art-Net]")
, sacnChannel(*io, "[sACN]")
, pollSocket(*io)
, pollPacket(artnet::encodePoll())
, sweepTimer(*io)
, pollTimer(*io)
{}

Listener::~Listener() {
    // Every pending handler holds a strong reference, so nothing can still
    // be queued against these sockets here.
    artnetChannel.socket.close();
    sacnChannel.socket.close();
    pollSocket.close();
}

expected<void> Listener::openArtNet() {
    auto& sock = artnetChannel.socket;
    if (auto ec = sock.open_v4()) return unexpected(ec);
    if (auto ec = sock.enable_reuse()) return unexpected(ec);
    if (auto ec = sock.enable_broadcast()) return unexpected(ec);
    if (auto ec = sock.bind(config.bindAddress, config.artnetPort)) {
        sock.close();
        return unexpected(ec);
    }
    return {};
}

expected<void> Listener::openSacn() {
    auto& sock = sacnChannel.socket;
    if (auto ec = sock.open_v4()) return unexpected(ec);
    if (auto ec = sock.enable_reuse()) return unexpected(ec);
    if (auto ec = sock.bind(config.bindAddress, config.sacnPort)) {
        sock.close();
        return unexpected(ec);
    }
    return {};
}

bool Listener::joinGroup(std::uint16_t universe) {
    if (!sacnChannel.socket.is_open()) {
        return false;
    }
    auto group = sacn::multicastAddress(universe);
    if (auto ec = sacnChannel.socket.join_group(group, config.bindAddress)) {
        ++groupsFailed;
        logDebug("[sACN] join ", group.to_string(), " failed: ", ec.message(), "\n");
        return false;
    }
    ++groupsJoined;
    return true;
}

void Listener::start() {
    if (running.exchange(true)) {
        return;
    }

    if (config.listenArtNet) {
        if (auto opened = openArtNet(); !opened) {
            logError("[Art-Net] cannot listen on ", config.bindAddress.to_string(), ":",
                     config.artnetPort, ": ", opened.error().message(), "\n");
        } else {
            artnetChannel.active = true;
            artnetChannel.port = artnetChannel.socket.local_port();
            logInfo("[Art-Net] listening on ", config.bindAddress.to_string(), ":",
                    artnetChannel.port.load(), "\n");
        }
    }

    if (config.listenSacn) {
        if (auto opened = openSacn(); !opened) {
            logError("[sACN] cannot listen on ", config.bindAddress.to_string(), ":",
                     config.sacnPort, ": ", opened.error().message(), "\n");
        } else {
            sacnChannel.active = true;
            sacnChannel.port = sacnChannel.socket.local_port();
            logInfo("[sACN] listening on ", config.bindAddress.to_string(), ":",
                    sacnChannel.port.load(), "\n");

            std::size_t requested = 0;
            for (std::uint32_t u = config.multicastFirstUniverse; u <= config.multicastLastUniverse; ++u) {
                ++requested;
                joinGroup(static_cast<std::uint16_t>(u));
            }
            if (requested > 0) {
                logInfo("[sACN] joined ", groupsJoined.load(), " of ", requested,
                        " multicast groups (universes ", config.multicastFirstUniverse,
                        "-", config.multicastLastUniverse, ")\n");
            }
        }
    }

    if (config.periodicPoll) {
        net::error_code ec = pollSocket.open_v4();
        if (!ec) ec = pollSocket.enable_broadcast();
        if (ec) {
            logError("[Listener] ArtPoll socket unavailable: ", ec.message(), "\n");
            pollSocket.close();
        }
    }

    // Socket setup above runs on the caller's thread before any async
    // operation exists; from here on everything is driven from the io thread.
    auto self = shared_from_this();
    net::asio::post(*io, [self] {
        if (self->artnetChannel.active) self->receive(self->artnetChannel);
        if (self->sacnChannel.active) self->receive(self->sacnChannel);
        self->scheduleSweep();
        if (self->pollSocket.is_open()) self->schedulePoll(std::chrono::milliseconds(0));
    });
}

void Listener::stop() {
    if (!running.exchange(false)) {
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    auto self = shared_from_this();
    net::asio::post(*io, [self, done] {
        self->artnetChannel.active = false;
        self->sacnChannel.active = false;
        self->sweepTimer.cancel();
        self->pollTimer.cancel();
        self->artnetChannel.retryTimer.cancel();
        self->sacnChannel.retryTimer.cancel();
        self->artnetChannel.socket.close();
        self->sacnChannel.socket.close();
        self->pollSocket.close();
        done->set_value();
    });

    if (finished.wait_for(STOP_WAIT) != std::future_status::ready) {
        logError("[Listener] I/O thread did not acknowledge stop within ", STOP_WAIT.count(), "ms\n");
    }
}

void Listener::receive(Channel& channel) {
    auto self = shared_from_this();
    channel.socket.raw().async_receive_from(
        net::asio::buffer(channel.buffer), channel.sender,
        [self, &channel](const net::error_code& ec, std::size_t size) {
            self->onDatagram(channel, ec, size);
        });
}

void Listener::onDatagram(Channel& channel, net::error_code ec, std::size_t size) {
    if (ec == net::asio::error::operation_aborted || !running || !channel.socket.is_open()) {
        return;
    }
    if (!ec && channel.pendingFault) {
        ec = channel.pendingFault;
        channel.pendingFault.clear();
    }
    if (ec) {
        retryReceive(channel, ec);
        return;
    }
    channel.consecutiveErrors = 0;

    const auto senderAddress = channel.sender.address();
    if (senderAddress.is_v4()) {
        const auto sender = senderAddress.to_v4();
        if (&channel == &artnetChannel) {
            if (auto packet = artnet::decode(channel.buffer.data(), size)) {
                router->routeArtNet(*packet, sender);
            } else {
                logDebug("[Art-Net] dropped ", size, " byte datagram from ", sender.to_string(), "\n");
            }
        } else {
            if (auto packet = sacn::decode(channel.buffer.data(), size)) {
                router->routeSacn(*packet, sender);
            } else {
                logDebug("[sACN] dropped ", size, " byte datagram from ", sender.to_string(), "\n");
            }
        }
    }

    receive(channel);
}

void Listener::retryReceive(Channel& channel, const net::error_code& ec) {
    ++receiveErrors;
    const unsigned shift = std::min(channel.consecutiveErrors, 4u);
    const auto delay = std::min(RETRY_FIRST * (1 << shift), RETRY_MAX);
    ++channel.consecutiveErrors;
    logError(channel.name, " receive failed: ", ec.message(), ", retrying in ", delay.count(), "ms\n");

    auto self = shared_from_this();
    channel.retryTimer.expires_after(delay);
    channel.retryTimer.async_wait([self, &channel](const net::error_code& timerEc) {
        if (timerEc == net::asio::error::operation_aborted || !self->running
            || !channel.socket.is_open()) {
            return;
        }
        self->receive(channel);
    });
}

void Listener::scheduleSweep() {
    auto self = shared_from_this();
    sweepTimer.expires_after(config.sweepInterval);
    sweepTimer.async_wait([self](const net::error_code& ec) {
        if (ec == net::asio::error::operation_aborted || !self->running) {
            return;
        }
        const auto evicted = self->router->registry()->sweep();
        if (evicted > 0) {
            logDebug("[Listener] evicted ", evicted, " silent source(s)\n");
        }
        self->router->events()->publish(SourcesChanged{});
        self->scheduleSweep();
    });
}

void Listener::schedulePoll(std::chrono::milliseconds delay) {
    auto self = shared_from_this();
    pollTimer.expires_after(delay);
    pollTimer.async_wait([self](const net::error_code& ec) {
        if (ec == net::asio::error::operation_aborted || !self->running) {
            return;
        }
        self->broadcastPoll();
        self->schedulePoll(self->config.pollInterval);
    });
}

void Listener::broadcastPoll() {
    const net::udp::endpoint target(config.pollAddress, config.pollPort);
    auto self = shared_from_this();
    pollSocket.raw().async_send_to(
        net::asio::buffer(pollPacket), target,
        [self, target](const net::error_code& ec, std::size_t) {
            if (ec && ec != net::asio::error::operation_aborted) {
                logError("[Art-Net] ArtPoll to ", target.address().to_string(), " failed: ",
                         ec.message(), "\n");
            }
        });
}

expected<void> Listener::sendDiscoveryPoll() {
    net::UdpSocket sock(*io);
    if (auto ec = sock.open_v4()) return unexpected(ec);
    if (auto ec = sock.enable_broadcast()) return unexpected(ec);

    const net::udp::endpoint target(config.pollAddress, config.pollPort);
    if (auto ec = sock.send_to(pollPacket.data(), pollPacket.size(), target, config.pollSendTimeout)) {
        logError("[Art-Net] ArtPoll to ", target.address().to_string(), " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    logDebug("[Art-Net] ArtPoll sent to ", target.address().to_string(), "\n");
    return {};
}

void Listener::joinUniverse(std::uint16_t universe) {
    auto self = shared_from_this();
    net::asio::post(*io, [self, universe] {
        if (self->joinGroup(universe)) {
            logInfo("[sACN] joined ", sacn::multicastAddress(universe).to_string(),
                    " for universe ", universe, "\n");
        }
    });
}

void Listener::failNextReceive(Protocol protocol, net::error_code ec) {
    auto done = std::make_shared<std::promise<void>>();
    auto applied = done->get_future();
    auto self = shared_from_this();
    net::asio::post(*io, [self, protocol, ec, done] {
        auto& channel = protocol == Protocol::ArtNet ? self->artnetChannel : self->sacnChannel;
        channel.pendingFault = ec;
        done->set_value();
    });
    if (applied.wait_for(STOP_WAIT) != std::future_status::ready) {
        logError("[Listener] I/O thread did not apply the receive fault within ", STOP_WAIT.count(), "ms\n");
    }
}

ListenerStatus Listener::status() const {
    ListenerStatus s;
    s.artnetActive = artnetChannel.active;
    s.sacnActive = sacnChannel.active;
    s.artnetPort = artnetChannel.port;
    s.sacnPort = sacnChannel.port;
    s.listening = running && (s.artnetActive || s.sacnActive);
    s.joinedGroups = groupsJoined;
    s.failedGroups = groupsFailed;
    s.receiveErrors = receiveErrors;
    return s;
}

} // namespace lxmonitor::monitor
