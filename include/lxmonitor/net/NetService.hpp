#pragma once
#include "lxmonitor/net/NetConfig.hpp"
#include <memory>
#include <thread>

namespace lxmonitor::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every receive loop and timer of the listener is posted to this one
 * executor, so handlers run serially and datagrams from one socket are
 * processed in the order they arrived.
 *
 * Lifetime notes:
 * - Stop listeners before `NetService` goes away so their handlers complete
 *   while the `io_context` is still running.
 * - A handler that throws is logged and the loop resumes; one bad datagram
 *   must not silence every socket.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    void run();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// Process-wide service, started on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace lxmonitor::net
