#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace lxmonitor::monitor {

using DmxFrame = std::vector<std::uint8_t>;

/**
 * @brief Latest DMX frame per universe.
 *
 * Last write wins; there is no history and no expiry. Readers may see a
 * frame whose source the registry has not caught up with yet (or has already
 * evicted); both are re-polled independently.
 */
class DmxStore {
public:
    void update(std::uint16_t universe, DmxFrame frame);
    std::optional<DmxFrame> get(std::uint16_t universe) const;
    std::map<std::uint16_t, DmxFrame> getAll() const;
    std::size_t universeCount() const;

private:
    mutable std::shared_mutex mutex;
    std::map<std::uint16_t, DmxFrame> frames;
};

using DmxStoreHandle = std::shared_ptr<DmxStore>;

} // namespace lxmonitor::monitor
