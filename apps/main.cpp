#include "lxmonitor/log/Log.hpp"
#include "lxmonitor/monitor/MonitorService.hpp"
#include "lxmonitor/net/NetConfig.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

using namespace lxmonitor;

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop = true;
}

void printUsage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " [options]\n"
        << "  --bind ADDR            local IPv4 address to listen on (default 0.0.0.0)\n"
        << "  --universes FIRST-LAST sACN multicast groups to join (default 1-100)\n"
        << "  --poll-address ADDR    ArtPoll destination (default 255.255.255.255)\n"
        << "  --no-poll              do not broadcast ArtPoll\n"
        << "  --capture IFACE        promiscuous capture on IFACE (\"auto\" = first interface)\n"
        << "  --list-interfaces      print capture interfaces and exit\n"
        << "  --interval SECONDS     source table refresh period (default 2)\n"
        << "  --duration SECONDS     exit after this long (default: until Ctrl-C)\n"
        << "  --verbose              per-packet debug logging\n";
}

// Prefix every log line with local wall-clock time; table output stays bare.
void installTimestampedLogging() {
    auto stamped = [](std::ostream& os) {
        return [&os](std::string_view message) {
            const std::time_t now = std::time(nullptr);
            std::tm local{};
            localtime_r(&now, &local);
            os << std::put_time(&local, "%H:%M:%S ") << message;
            os.flush();
        };
    };
    setLogHandlers(stamped(std::cout), stamped(std::cerr));
}

bool parseAddress(const std::string& text, net::address_v4& out) {
    net::error_code ec;
    auto address = net::asio::ip::make_address_v4(text, ec);
    if (ec) {
        logError("Invalid IPv4 address '", text, "': ", ec.message(), "\n");
        return false;
    }
    out = address;
    return true;
}

bool parseRange(const std::string& text, std::uint16_t& first, std::uint16_t& last) {
    const auto dash = text.find('-');
    if (dash == std::string::npos) {
        logError("Expected FIRST-LAST, got '", text, "'\n");
        return false;
    }
    const unsigned long a = std::strtoul(text.substr(0, dash).c_str(), nullptr, 10);
    const unsigned long b = std::strtoul(text.substr(dash + 1).c_str(), nullptr, 10);
    if (a == 0 || a > 63999 || b > 63999) {
        logError("Universe range must be within 1-63999\n");
        return false;
    }
    first = static_cast<std::uint16_t>(a);
    last = static_cast<std::uint16_t>(b);
    return true;
}

std::string joinUniverses(const std::vector<std::uint16_t>& universes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < universes.size(); ++i) {
        if (i) oss << ',';
        oss << universes[i];
    }
    return oss.str();
}

void printSources(const monitor::MonitorService& service) {
    const auto sources = service.sources();
    const auto listener = service.listenerStatus();
    const auto capture = service.captureStatus();

    std::cout << "\n" << sources.size() << " source(s), "
              << service.frames().size() << " universe(s) with data"
              << (listener.listening ? "" : "  [not listening]");
    if (capture.enabled) {
        std::cout << "  [capture " << capture.interface.value_or("?") << ": "
                  << capture.packetsCaptured << " frames]";
    }
    std::cout << "\n";

    std::cout << std::left
              << std::setw(44) << "ID"
              << std::setw(28) << "NAME"
              << std::setw(8) << "STATUS"
              << std::setw(10) << "DIR"
              << std::right
              << std::setw(7) << "FPS"
              << std::setw(8) << "LOSS%"
              << std::setw(9) << "JITTER"
              << "  UNIVERSES\n";

    for (const auto& s : sources) {
        std::cout << std::left
                  << std::setw(44) << s.id
                  << std::setw(28) << s.name.substr(0, 27)
                  << std::setw(8) << monitor::toString(s.status)
                  << std::setw(10) << monitor::toString(s.direction)
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(7) << s.fps
                  << std::setw(8) << s.packetLossPercent
                  << std::setw(9) << s.latencyJitterMs
                  << "  " << joinUniverses(s.universes);
        if (!s.duplicateUniverses.empty()) {
            std::cout << "  DUP[" << joinUniverses(s.duplicateUniverses) << "]";
        }
        if (s.fpsWarning != monitor::FpsWarning::None) {
            std::cout << "  fps " << monitor::toString(s.fpsWarning);
        }
        std::cout << "\n";
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char** argv) {
    monitor::MonitorConfig config;
    bool listInterfaces = false;
    std::chrono::seconds interval{2};
    std::chrono::seconds duration{0};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> const char* { return (i + 1 < argc) ? argv[++i] : nullptr; };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--verbose") {
            config.debugLogging = true;
        } else if (arg == "--no-poll") {
            config.listener.periodicPoll = false;
        } else if (arg == "--list-interfaces") {
            listInterfaces = true;
        } else if (arg == "--bind" || arg == "--poll-address") {
            const char* value = next();
            auto& target = (arg == "--bind") ? config.listener.bindAddress : config.listener.pollAddress;
            if (!value || !parseAddress(value, target)) return 2;
        } else if (arg == "--universes") {
            const char* value = next();
            if (!value || !parseRange(value, config.listener.multicastFirstUniverse,
                                      config.listener.multicastLastUniverse)) return 2;
        } else if (arg == "--capture") {
            const char* value = next();
            if (!value) { printUsage(argv[0]); return 2; }
            config.captureInterface = std::string(value);
        } else if (arg == "--interval" || arg == "--duration") {
            const char* value = next();
            if (!value) { printUsage(argv[0]); return 2; }
            const auto seconds = std::chrono::seconds(std::strtol(value, nullptr, 10));
            (arg == "--interval" ? interval : duration) = seconds;
        } else {
            logError("Unknown option '", arg, "'\n");
            printUsage(argv[0]);
            return 2;
        }
    }
    if (interval.count() < 1) interval = std::chrono::seconds(1);
    installTimestampedLogging();

    // "auto" is resolved by the service to the first capture interface.
    bool captureAuto = false;
    if (config.captureInterface && *config.captureInterface == "auto") {
        config.captureInterface.reset();
        captureAuto = true;
    }

    monitor::MonitorService service(config);

    if (listInterfaces) {
        const auto status = service.captureStatus();
        if (!status.driverAvailable) {
            std::cout << "Packet capture is not available on this system.\n";
            return 1;
        }
        for (const auto& iface : service.captureInterfaces()) {
            std::cout << iface.name;
            if (!iface.description.empty()) std::cout << "  (" << iface.description << ")";
            std::cout << "\n";
        }
        return 0;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Forward events to the log; the table itself is re-polled on a timer.
    std::thread forwarder([subscription = service.subscribe()]() mutable {
        std::uint64_t frames = 0;
        while (!g_stop) {
            auto event = subscription.receive(std::chrono::milliseconds(500));
            if (!event) {
                const auto& err = event.error();
                if (err.kind == monitor::RecvError::Kind::Lagged) {
                    logInfo("[Listener] event forwarder lagged, ", err.missed, " event(s) dropped\n");
                    continue;
                }
                if (err.kind == monitor::RecvError::Kind::Closed) break;
                continue;
            }
            if (std::holds_alternative<monitor::FrameUpdated>(*event)) {
                const auto& frame = std::get<monitor::FrameUpdated>(*event);
                if (++frames % 1000 == 0) {
                    logDebug("[Listener] ", frames, " frames; latest universe ", frame.universe,
                             " from ", frame.sourceIp, "\n");
                }
            }
        }
    });

    service.start();
    if (captureAuto) {
        if (auto started = service.setCaptureEnabled(true); !started) {
            logError("[Capture] cannot start: ", started.error().message(), "\n");
        }
    }

    const auto started = std::chrono::steady_clock::now();
    auto nextTable = started + interval;
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        const auto now = std::chrono::steady_clock::now();
        if (duration.count() > 0 && now - started >= duration) break;
        if (now >= nextTable) {
            printSources(service);
            nextTable = now + interval;
        }
    }

    g_stop = true;
    service.stop();
    forwarder.join();
    std::cout << "Done." << std::endl;
    return 0;
}
