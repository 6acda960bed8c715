#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace lxmonitor::monitor {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Packets per second over a trailing one-second window.
 */
class FpsCounter {
public:
    void record(TimePoint now);
    float fps(TimePoint now) const;

private:
    void prune(TimePoint now);

    std::deque<TimePoint> arrivals;
};

/**
 * @brief Packet loss from an 8-bit wrapping sequence number.
 *
 * Counters live in five-second windows. The first packet of a window is the
 * baseline (counted as received, adds nothing to expected); every later
 * packet adds the forward distance `(seq - last) mod 256` to expected.
 * Duplicates and reordering push received above expected, which clamps to
 * zero loss.
 */
class SequenceTracker {
public:
    void record(std::uint8_t sequence, TimePoint now);
    float lossPercent() const;

    std::uint32_t expected() const { return expectedCount; }
    std::uint32_t received() const { return receivedCount; }

private:
    std::optional<TimePoint> windowStart;
    std::optional<std::uint8_t> lastSequence;
    std::uint32_t expectedCount = 0;
    std::uint32_t receivedCount = 0;
};

/**
 * @brief Inter-arrival jitter: population standard deviation of the most
 * recent 100 intervals, in milliseconds.
 */
class LatencyTracker {
public:
    void record(TimePoint now);
    float jitterMs() const;
    std::size_t sampleCount() const { return intervals.size(); }

private:
    std::optional<TimePoint> lastArrival;
    std::deque<double> intervals; // seconds
};

} // namespace lxmonitor::monitor
