#pragma once
#include "lxmonitor/capture/CaptureBackend.hpp"

#include <pcap/pcap.h>

namespace lxmonitor::capture {

/**
 * @brief libpcap capture of Art-Net and sACN traffic addressed to any host.
 *
 * Opens the interface in promiscuous mode with a BPF filter for the two
 * protocol ports. The read timeout bounds how long `stop()` waits for the
 * worker to notice the stop flag. Only useful on a mirrored switch port or a
 * shared medium.
 */
class PcapCapture : public CaptureBackend {
public:
    explicit PcapCapture(monitor::PacketRouterHandle router);
    ~PcapCapture() override;

    /// True when libpcap can enumerate at least one device.
    static bool hasDevices();

    bool available() const override;
    std::vector<CaptureInterface> interfaces() const override;

protected:
    expected<void> open(const std::string& interfaceName) override;
    void close() override;
    void run() override;

private:
    pcap_t* handle = nullptr;
};

} // namespace lxmonitor::capture
