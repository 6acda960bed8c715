#pragma once

#include "lxmonitor/monitor/NetworkSource.hpp"
#include "lxmonitor/monitor/SourceTrackers.hpp"
#include "lxmonitor/sacn/SacnPacket.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lxmonitor::monitor {

/// One Art-Net packet attributed to the device at `ip`.
struct ArtNetObservation {
    std::string ip;
    std::string shortName;
    std::string longName;
    std::optional<std::array<std::uint8_t, 6>> mac;
    std::vector<std::uint16_t> universes;
    SourceDirection direction = SourceDirection::Unknown;
    std::optional<std::uint8_t> sequence;
};

/// One sACN packet attributed to the component `cid` seen at `ip`.
/// An all-zero cid marks a receiver inferred from captured unicast traffic.
struct SacnObservation {
    std::string ip;
    std::string sourceName;
    sacn::Cid cid{};
    std::optional<std::uint8_t> priority;
    std::vector<std::uint16_t> universes;
    SourceDirection direction = SourceDirection::Unknown;
    std::optional<std::uint8_t> sequence;
};

/**
 * @brief Table of every device observed on the network.
 *
 * Each entry owns its FPS, sequence and latency trackers. Packet updates and
 * the periodic sweep take the writer lock; snapshots take the reader lock.
 * The universe -> source index used for duplicate detection is rebuilt from
 * scratch on every sweep, never maintained incrementally.
 *
 * Every mutating call accepts the current steady-clock time so that the
 * status and window logic can be driven deterministically; the default is
 * Clock::now().
 */
class SourceRegistry {
public:
    SourceRegistry() = default;

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    void updateArtNet(const ArtNetObservation& observation, TimePoint now = Clock::now());
    void updateSacn(const SacnObservation& observation, TimePoint now = Clock::now());

    /**
     * @brief Recompute status, rates and duplicate flags; evict sources silent
     * for 60 s or more.
     * @return number of evicted sources.
     */
    std::size_t sweep(TimePoint now = Clock::now());

    /// Snapshot of all sources, ordered by id.
    std::vector<NetworkSource> sources() const;
    std::optional<NetworkSource> find(const std::string& id) const;
    std::size_t size() const;

    static std::string artnetId(const std::string& ip);
    static std::string sacnId(const sacn::Cid& cid, const std::string& ip);

private:
    struct Entry {
        NetworkSource source;
        TimePoint lastPacket{};
        FpsCounter fps;
        SequenceTracker sequence;
        LatencyTracker latency;
    };

    void recordPacket(Entry& entry,
                      const std::vector<std::uint16_t>& universes,
                      SourceDirection direction,
                      std::optional<std::uint8_t> sequence,
                      TimePoint now);
    static void refreshDiagnostics(Entry& entry, TimePoint now);
    void rebuildUniverseIndex();

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    std::map<std::uint16_t, std::vector<std::string>> universeIndex;
};

using SourceRegistryHandle = std::shared_ptr<SourceRegistry>;

} // namespace lxmonitor::monitor
