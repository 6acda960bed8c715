#include "lxmonitor/monitor/SourceRegistry.hpp"

#include "lxmonitor/artnet/ArtNetProtocol.hpp"
#include "lxmonitor/core/Config.hpp"
#include "lxmonitor/sacn/SacnProtocol.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace lxmonitor::monitor {
namespace {

std::uint64_t wallClockMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

void mergeUniverses(std::vector<std::uint16_t>& into, const std::vector<std::uint16_t>& add) {
    for (auto universe : add) {
        auto it = std::lower_bound(into.begin(), into.end(), universe);
        if (it == into.end() || *it != universe) {
            into.insert(it, universe);
        }
    }
}

std::string artnetDisplayName(const NetworkSource& source) {
    if (source.artnetLongName && !source.artnetLongName->empty()) return *source.artnetLongName;
    if (source.artnetShortName && !source.artnetShortName->empty()) return *source.artnetShortName;
    return "ArtNet @ " + source.ip;
}

} // namespace

std::string SourceRegistry::artnetId(const std::string& ip) {
    return "artnet-" + ip;
}

std::string SourceRegistry::sacnId(const sacn::Cid& cid, const std::string& ip) {
    // A pure receiver never transmits its CID; the IP is the only stable key.
    if (sacn::isZeroCid(cid)) {
        return "sacn-" + ip;
    }
    return "sacn-" + sacn::cidToString(cid);
}

void SourceRegistry::updateArtNet(const ArtNetObservation& observation, TimePoint now) {
    const std::string id = artnetId(observation.ip);
    std::unique_lock lock(mutex);

    auto [it, inserted] = entries.try_emplace(id);
    Entry& entry = it->second;
    NetworkSource& source = entry.source;
    if (inserted) {
        source.id = id;
        source.ip = observation.ip;
        source.protocol = Protocol::ArtNet;
        source.firstSeenMs = wallClockMs();
    }

    if (!observation.shortName.empty()) source.artnetShortName = observation.shortName;
    if (!observation.longName.empty()) source.artnetLongName = observation.longName;
    if (observation.mac) source.macAddress = artnet::formatMac(*observation.mac);
    source.name = artnetDisplayName(source);

    recordPacket(entry, observation.universes, observation.direction, observation.sequence, now);
}

void SourceRegistry::updateSacn(const SacnObservation& observation, TimePoint now) {
    const std::string id = sacnId(observation.cid, observation.ip);
    std::unique_lock lock(mutex);

    auto [it, inserted] = entries.try_emplace(id);
    Entry& entry = it->second;
    NetworkSource& source = entry.source;
    if (inserted) {
        source.id = id;
        source.ip = observation.ip;
        source.protocol = Protocol::Sacn;
        source.firstSeenMs = wallClockMs();
        if (!sacn::isZeroCid(observation.cid)) {
            source.sacnCid = sacn::cidToString(observation.cid);
        }
        source.name = "sACN @ " + observation.ip;
    }

    if (!observation.sourceName.empty()) source.name = observation.sourceName;
    if (observation.priority) source.sacnPriority = observation.priority;

    recordPacket(entry, observation.universes, observation.direction, observation.sequence, now);
}

void SourceRegistry::recordPacket(Entry& entry,
                                  const std::vector<std::uint16_t>& universes,
                                  SourceDirection direction,
                                  std::optional<std::uint8_t> sequence,
                                  TimePoint now) {
    entry.lastPacket = now;
    entry.fps.record(now);
    entry.latency.record(now);
    if (sequence) {
        entry.sequence.record(*sequence, now);
    }

    NetworkSource& source = entry.source;
    source.packetCount += 1;
    source.lastSeenMs = wallClockMs();
    source.direction = escalate(source.direction, direction);
    mergeUniverses(source.universes, universes);

    refreshDiagnostics(entry, now);
}

void SourceRegistry::refreshDiagnostics(Entry& entry, TimePoint now) {
    NetworkSource& source = entry.source;
    const auto silence = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.lastPacket);
    source.status = statusForSilence(silence.count());
    source.fps = entry.fps.fps(now);
    source.fpsWarning = fpsWarningFor(source.fps);
    source.packetLossPercent = entry.sequence.lossPercent();
    source.latencyJitterMs = entry.latency.jitterMs();
}

std::size_t SourceRegistry::sweep(TimePoint now) {
    std::unique_lock lock(mutex);

    std::size_t evicted = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (now - it->second.lastPacket >= config::SOURCE_EVICT_AFTER) {
            it = entries.erase(it);
            ++evicted;
            continue;
        }
        refreshDiagnostics(it->second, now);
        ++it;
    }

    rebuildUniverseIndex();
    return evicted;
}

void SourceRegistry::rebuildUniverseIndex() {
    universeIndex.clear();
    for (auto& [id, entry] : entries) {
        entry.source.duplicateUniverses.clear();
        for (auto universe : entry.source.universes) {
            universeIndex[universe].push_back(id);
        }
    }

    // Index iteration is ordered by universe, so each duplicate list stays sorted.
    for (const auto& [universe, ids] : universeIndex) {
        if (ids.size() < 2) continue;
        for (const auto& id : ids) {
            entries.at(id).source.duplicateUniverses.push_back(universe);
        }
    }
}

std::vector<NetworkSource> SourceRegistry::sources() const {
    std::shared_lock lock(mutex);
    std::vector<NetworkSource> out;
    out.reserve(entries.size());
    for (const auto& [id, entry] : entries) {
        out.push_back(entry.source);
    }
    std::sort(out.begin(), out.end(),
              [](const NetworkSource& a, const NetworkSource& b) { return a.id < b.id; });
    return out;
}

std::optional<NetworkSource> SourceRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.source;
}

std::size_t SourceRegistry::size() const {
    std::shared_lock lock(mutex);
    return entries.size();
}

} // namespace lxmonitor::monitor
