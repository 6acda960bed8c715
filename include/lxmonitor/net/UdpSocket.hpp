#pragma once
#include "lxmonitor/net/NetConfig.hpp"
#include "lxmonitor/net/Deadline.hpp"

#include <cstdint>

namespace lxmonitor::net {

/**
 * UdpSocket
 *
 * Small helper around `udp::socket` for the listener and the discovery poll.
 *
 * - Setup calls return the `error_code` of the failing option so callers can
 *   decide whether the failure is fatal (bind) or merely degraded (a single
 *   multicast join).
 * - `send_to` uses the `with_deadline` pattern and therefore must not be
 *   called from a handler running on the socket's own io_context; receive
 *   loops use `raw().async_receive_from` directly.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind(const address_v4& address, std::uint16_t port) {
        error_code ec;
        sock_.bind(udp::endpoint(address, port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    // SO_REUSEADDR, plus SO_REUSEPORT where the platform has it, so several
    // monitors (or a console on the same host) can share the sACN port.
    error_code enable_reuse() {
        error_code ec;
        sock_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) return ec;
#if defined(SO_REUSEPORT)
        using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
        sock_.set_option(reuse_port(true), ec);
#endif
        return ec;
    }

    error_code join_group(const address_v4& group, const address_v4& iface) {
        error_code ec;
        sock_.set_option(asio::ip::multicast::join_group(group, iface), ec);
        return ec;
    }

    // One datagram, whole or not at all, within `timeout`.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto sent = with_deadline(sock_.get_executor(), timeout,
            [&](auto handler){ sock_.async_send_to(asio::buffer(data, n), ep, 0, handler); },
            [&]{ error_code ignore; sock_.cancel(ignore); });
        if (!sent.ec && sent.bytes != n) {
            return asio::error::message_size;
        }
        return sent.ec;
    }

    std::uint16_t local_port() const {
        error_code ec;
        auto ep = sock_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    bool is_open() const { return sock_.is_open(); }
    udp::socket& raw() { return sock_; }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace lxmonitor::net
