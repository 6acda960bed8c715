#pragma once

#include "lxmonitor/core/Expected.hpp"
#include "lxmonitor/monitor/PacketRouter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lxmonitor::capture {

struct CaptureInterface {
    std::string name;
    std::string description;
};

struct CaptureStatus {
    bool enabled = false;
    std::optional<std::string> interface;
    bool driverAvailable = false;
    std::uint64_t packetsCaptured = 0;
    std::optional<std::string> lastError;
};

/**
 * @brief Base class for promiscuous capture backends.
 *
 * Mirrors the device worker model: the base owns a worker thread that calls
 * the virtual `run()` until `stop()`, and `running` is the atomic flag the
 * loop polls. Derived classes provide the driver side:
 * - `available()` / `interfaces()` describe what the driver can see,
 * - `open()` acquires the device synchronously so activation errors reach
 *   the caller,
 * - `run()` pulls frames and hands each one to `handleFrame()`,
 * - `close()` releases the device after the worker has been joined.
 *
 * Derived destructors must call `stop()` so `close()` still dispatches to
 * the derived class.
 */
class CaptureBackend {
public:
    explicit CaptureBackend(monitor::PacketRouterHandle router);
    virtual ~CaptureBackend();

    CaptureBackend(const CaptureBackend&) = delete;
    CaptureBackend& operator=(const CaptureBackend&) = delete;

    virtual bool available() const = 0;
    virtual std::vector<CaptureInterface> interfaces() const = 0;

    /**
     * @brief Open @p interfaceName and start the worker thread.
     *
     * Refused without any state change when the driver is unavailable, the
     * interface is unknown or capture is already running. Concurrent calls to
     * start() and stop() are serialized.
     */
    expected<void> start(const std::string& interfaceName);

    /// Request the worker to stop, wait for it, then release the device.
    void stop();

    bool isRunning() const { return running; }
    CaptureStatus status() const;

protected:
    virtual expected<void> open(const std::string& interfaceName) = 0;
    virtual void close() = 0;
    virtual void run() = 0; // the worker loop

    /// Count, parse and route one raw Ethernet frame.
    void handleFrame(const std::uint8_t* frame, std::size_t size);

    /// Record a fatal capture error; the worker loop should return after this.
    void fail(const std::string& message);

    void setLastError(std::optional<std::string> message);

    std::atomic<bool> running{false};

private:
    monitor::PacketRouterHandle router;

    // Held across start() and stop(); the worker never takes it.
    std::mutex lifecycleMutex;
    std::thread worker;
    std::atomic<bool> enabled{false};
    std::atomic<std::uint64_t> packetsCaptured{0};

    mutable std::mutex stateMutex;
    std::optional<std::string> interfaceName;
    std::optional<std::string> lastError;
};

using CaptureBackendHandle = std::unique_ptr<CaptureBackend>;

/**
 * @brief Pick the capture backend at runtime.
 *
 * Asks libpcap for devices; a driver error or an empty device list falls
 * back to NullCapture.
 */
CaptureBackendHandle makeCaptureBackend(monitor::PacketRouterHandle router);

} // namespace lxmonitor::capture
