#include "lxmonitor/core/Error.hpp"

#include <string>

namespace lxmonitor {
namespace {

class MonitorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "lxmonitor"; }

    std::string message(int value) const override {
        switch (static_cast<MonitorErrc>(value)) {
            case MonitorErrc::CaptureUnavailable:
                return "packet capture driver is not available";
            case MonitorErrc::UnknownInterface:
                return "capture interface not found";
            case MonitorErrc::CaptureAlreadyRunning:
                return "capture is already running";
            case MonitorErrc::NoCaptureInterfaces:
                return "no capture interfaces available";
            case MonitorErrc::CaptureOpenFailed:
                return "failed to open capture device";
            case MonitorErrc::CaptureFilterFailed:
                return "failed to install capture filter";
        }
        return "unknown lxmonitor error";
    }
};

} // namespace

const std::error_category& monitorCategory() noexcept {
    static MonitorCategory category;
    return category;
}

std::error_code make_error_code(MonitorErrc e) noexcept {
    return {static_cast<int>(e), monitorCategory()};
}

} // namespace lxmonitor
