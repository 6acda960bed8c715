#include "lxmonitor/net/NetService.hpp"
#include "lxmonitor/log/Log.hpp"

#include <exception>

namespace lxmonitor::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ run(); })
{
    logDebug("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

void NetService::run() {
    for (;;) {
        try {
            io_->run();
            return; // stopped
        } catch (const std::exception& e) {
            logError("[NetService] handler threw: ", e.what(), "\n");
        }
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    static NetService service;
    return service.io();
}

} // namespace lxmonitor::net
