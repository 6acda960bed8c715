#include "lxmonitor/monitor/DmxStore.hpp"

#include <mutex>

namespace lxmonitor::monitor {

void DmxStore::update(std::uint16_t universe, DmxFrame frame) {
    std::unique_lock lock(mutex);
    frames[universe] = std::move(frame);
}

std::optional<DmxFrame> DmxStore::get(std::uint16_t universe) const {
    std::shared_lock lock(mutex);
    auto it = frames.find(universe);
    if (it == frames.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::uint16_t, DmxFrame> DmxStore::getAll() const {
    std::shared_lock lock(mutex);
    return frames;
}

std::size_t DmxStore::universeCount() const {
    std::shared_lock lock(mutex);
    return frames.size();
}

} // namespace lxmonitor::monitor
