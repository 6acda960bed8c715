#pragma once

#include "lxmonitor/core/Expected.hpp"
#include "lxmonitor/monitor/MonitorConfig.hpp"
#include "lxmonitor/monitor/NetworkSource.hpp"
#include "lxmonitor/monitor/PacketRouter.hpp"
#include "lxmonitor/net/NetConfig.hpp"
#include "lxmonitor/net/UdpSocket.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lxmonitor::monitor {

struct ListenerStatus {
    bool listening = false;
    bool artnetActive = false;
    bool sacnActive = false;
    std::uint16_t artnetPort = 0;
    std::uint16_t sacnPort = 0;
    std::size_t joinedGroups = 0;
    std::size_t failedGroups = 0;
    std::uint64_t receiveErrors = 0;
};

/**
 * @brief UDP ingestion for Art-Net and sACN plus the periodic maintenance
 * tasks.
 *
 * All work runs as chained async operations on one io_context:
 * - one receive loop per protocol socket,
 * - a sweep timer (registry maintenance + sources-changed event),
 * - an ArtPoll timer that re-broadcasts discovery.
 *
 * A socket that fails to bind is logged and its loop never starts; the other
 * protocol and the timers carry on. A receive error is logged and the loop
 * re-arms after a backoff that doubles while errors repeat. Handlers keep the listener alive through
 * shared_from_this(), so create it with Listener::create().
 */
class Listener : public std::enable_shared_from_this<Listener> {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    static std::shared_ptr<Listener> create(std::shared_ptr<net::asio::io_context> io,
                                            ListenerConfig config,
                                            PacketRouterHandle router);

    // Public for make_shared only; CreateTag keeps it out of reach.
    Listener(CreateTag,
             std::shared_ptr<net::asio::io_context> io,
             ListenerConfig config,
             PacketRouterHandle router);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /// Bind sockets, join multicast groups and start every loop.
    void start();

    /// Close sockets and cancel timers. Must not be called from an I/O handler.
    void stop();

    /**
     * @brief Broadcast one ArtPoll now.
     *
     * Blocks until the datagram is handed to the OS or the send timeout
     * expires, so it must not be called from an I/O handler.
     */
    expected<void> sendDiscoveryPoll();

    /// Join the multicast group of one more universe (asynchronously).
    void joinUniverse(std::uint16_t universe);

    ListenerStatus status() const;

    /// Test hook: the next datagram received on `protocol` completes with `ec`.
    void failNextReceive(Protocol protocol, net::error_code ec);

private:
    struct Channel {
        explicit Channel(net::asio::io_context& io, const char* tag)
        : socket(io), name(tag), retryTimer(io) {}

        net::UdpSocket socket;
        const char* name;
        net::asio::steady_timer retryTimer;
        unsigned consecutiveErrors = 0;
        net::error_code pendingFault;
        std::array<std::uint8_t, config::MAX_DATAGRAM_SIZE> buffer{};
        net::udp::endpoint sender;
        std::atomic<bool> active{false};
        std::atomic<std::uint16_t> port{0};
    };

    expected<void> openArtNet();
    expected<void> openSacn();
    bool joinGroup(std::uint16_t universe);

    void receive(Channel& channel);
    void onDatagram(Channel& channel, net::error_code ec, std::size_t size);
    void retryReceive(Channel& channel, const net::error_code& ec);

    void scheduleSweep();
    void schedulePoll(std::chrono::milliseconds delay);
    void broadcastPoll();

    std::shared_ptr<net::asio::io_context> io;
    ListenerConfig config;
    PacketRouterHandle router;

    Channel artnetChannel;
    Channel sacnChannel;
    net::UdpSocket pollSocket;
    std::vector<std::uint8_t> pollPacket;
    net::asio::steady_timer sweepTimer;
    net::asio::steady_timer pollTimer;

    std::atomic<bool> running{false};
    std::atomic<std::size_t> groupsJoined{0};
    std::atomic<std::size_t> groupsFailed{0};
    std::atomic<std::uint64_t> receiveErrors{0};
};

using ListenerHandle = std::shared_ptr<Listener>;

} // namespace lxmonitor::monitor
