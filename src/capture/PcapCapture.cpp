#include "lxmonitor/capture/PcapCapture.hpp"
#include "lxmonitor/capture/NullCapture.hpp"

#include "lxmonitor/core/Config.hpp"
#include "lxmonitor/core/Error.hpp"
#include "lxmonitor/log/Log.hpp"

#include <pcap/dlt.h>

#include <string>
#include <utility>

namespace lxmonitor::capture {

namespace {

std::string captureFilter() {
    return "udp port " + std::to_string(config::ARTNET_PORT) +
           " or udp port " + std::to_string(config::SACN_PORT);
}

} // namespace

PcapCapture::PcapCapture(monitor::PacketRouterHandle router)
: CaptureBackend(std::move(router))
{}

PcapCapture::~PcapCapture() {
    stop(); // join the worker before the handle goes away
}

bool PcapCapture::hasDevices() {
    char errbuf[PCAP_ERRBUF_SIZE]{0};
    pcap_if_t* devices = nullptr;
    if (pcap_findalldevs(&devices, errbuf) != 0) {
        logDebug("[Capture] pcap_findalldevs failed: ", errbuf, "\n");
        return false;
    }
    const bool any = devices != nullptr;
    pcap_freealldevs(devices);
    return any;
}

bool PcapCapture::available() const {
    return hasDevices();
}

std::vector<CaptureInterface> PcapCapture::interfaces() const {
    std::vector<CaptureInterface> out;
    char errbuf[PCAP_ERRBUF_SIZE]{0};
    pcap_if_t* devices = nullptr;
    if (pcap_findalldevs(&devices, errbuf) != 0) {
        logError("[Capture] cannot list interfaces: ", errbuf, "\n");
        return out;
    }
    for (pcap_if_t* d = devices; d != nullptr; d = d->next) {
        out.push_back({d->name, d->description ? d->description : ""});
    }
    pcap_freealldevs(devices);
    return out;
}

expected<void> PcapCapture::open(const std::string& interfaceName) {
    char errbuf[PCAP_ERRBUF_SIZE]{0};
    pcap_t* h = pcap_open_live(interfaceName.c_str(),
                               config::CAPTURE_SNAPLEN,
                               1, // promiscuous
                               config::CAPTURE_READ_TIMEOUT_MS,
                               errbuf);
    if (!h) {
        setLastError(std::string("failed to open ") + interfaceName + ": " + errbuf);
        logError("[Capture] pcap_open_live(", interfaceName, ") failed: ", errbuf, "\n");
        return unexpected(make_error_code(MonitorErrc::CaptureOpenFailed));
    }

    if (pcap_datalink(h) != DLT_EN10MB) {
        logInfo("[Capture] ", interfaceName, " is not an Ethernet link (",
                pcap_datalink_val_to_name(pcap_datalink(h)), "); frames will not decode\n");
    }

    const std::string filter = captureFilter();
    bpf_program program{};
    if (pcap_compile(h, &program, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
        setLastError(std::string("failed to compile filter: ") + pcap_geterr(h));
        logError("[Capture] pcap_compile(\"", filter, "\") failed: ", pcap_geterr(h), "\n");
        pcap_close(h);
        return unexpected(make_error_code(MonitorErrc::CaptureFilterFailed));
    }
    const int rc = pcap_setfilter(h, &program);
    pcap_freecode(&program);
    if (rc != 0) {
        setLastError(std::string("failed to set filter: ") + pcap_geterr(h));
        logError("[Capture] pcap_setfilter failed: ", pcap_geterr(h), "\n");
        pcap_close(h);
        return unexpected(make_error_code(MonitorErrc::CaptureFilterFailed));
    }

    logInfo("[Capture] filter: ", filter, "\n");
    handle = h;
    return {};
}

void PcapCapture::close() {
    if (handle) {
        pcap_close(handle);
        handle = nullptr;
    }
}

void PcapCapture::run() {
    while (running) {
        pcap_pkthdr* header = nullptr;
        const u_char* data = nullptr;
        const int r = pcap_next_ex(handle, &header, &data);
        if (r == 1) {
            handleFrame(data, header->caplen);
        } else if (r == 0) {
            continue; // read timeout, re-check the stop flag
        } else {
            fail(std::string("capture error: ") + pcap_geterr(handle));
            return;
        }
    }
}

CaptureBackendHandle makeCaptureBackend(monitor::PacketRouterHandle router) {
    if (PcapCapture::hasDevices()) {
        return std::make_unique<PcapCapture>(std::move(router));
    }
    logInfo("[Capture] no capture driver or devices; promiscuous capture disabled\n");
    return std::make_unique<NullCapture>(std::move(router));
}

} // namespace lxmonitor::capture
