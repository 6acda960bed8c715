#include "lxmonitor/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace lxmonitor::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> debugEnabled{false};

LogHandler currentInfoHandler() {
    std::lock_guard lock(sinkMutex);
    return infoHandler;
}

} // namespace

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setDebugLogging(bool enabled) {
    debugEnabled.store(enabled, std::memory_order_relaxed);
}

bool debugLoggingEnabled() {
    return debugEnabled.load(std::memory_order_relaxed);
}

void logInfo(std::string_view message) {
    if (auto handler = currentInfoHandler()) {
        handler(message);
    }
}

void logError(std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = errorHandler;
    }
    if (handler) {
        handler(message);
    }
}

void logDebug(std::string_view message) {
    if (!debugLoggingEnabled()) {
        return;
    }
    if (auto handler = currentInfoHandler()) {
        handler(message);
    }
}

} // namespace lxmonitor::log
