#pragma once
#include "lxmonitor/capture/CaptureBackend.hpp"

namespace lxmonitor::capture {

// Stand-in when no capture driver is present: lists nothing and refuses to start.
class NullCapture : public CaptureBackend {
public:
    explicit NullCapture(monitor::PacketRouterHandle router);
    ~NullCapture() override;

    bool available() const override { return false; }
    std::vector<CaptureInterface> interfaces() const override { return {}; }

protected:
    expected<void> open(const std::string& interfaceName) override;
    void close() override {}
    void run() override {}
};

} // namespace lxmonitor::capture
