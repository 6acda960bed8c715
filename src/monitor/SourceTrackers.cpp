#include "lxmonitor/monitor/SourceTrackers.hpp"

#include "lxmonitor/core/Config.hpp"

#include <algorithm>
#include <cmath>

namespace lxmonitor::monitor {

void FpsCounter::prune(TimePoint now) {
    while (!arrivals.empty() && now - arrivals.front() >= config::FPS_WINDOW) {
        arrivals.pop_front();
    }
}

void FpsCounter::record(TimePoint now) {
    prune(now);
    arrivals.push_back(now);
}

float FpsCounter::fps(TimePoint now) const {
    const auto inWindow = std::count_if(arrivals.begin(), arrivals.end(),
        [now](TimePoint t) { return now - t < config::FPS_WINDOW; });
    return static_cast<float>(inWindow);
}

void SequenceTracker::record(std::uint8_t sequence, TimePoint now) {
    if (!windowStart || now - *windowStart >= config::SEQUENCE_WINDOW) {
        windowStart = now;
        lastSequence = sequence;
        expectedCount = 0;
        receivedCount = 1;
        return;
    }

    if (lastSequence) {
        expectedCount += static_cast<std::uint8_t>(sequence - *lastSequence);
    } else {
        expectedCount += 1;
    }
    receivedCount += 1;
    lastSequence = sequence;
}

float SequenceTracker::lossPercent() const {
    if (expectedCount == 0) {
        return 0.0f;
    }
    const double missing = static_cast<double>(expectedCount) - static_cast<double>(receivedCount);
    const double percent = missing / static_cast<double>(expectedCount) * 100.0;
    return static_cast<float>(std::clamp(percent, 0.0, 100.0));
}

void LatencyTracker::record(TimePoint now) {
    if (lastArrival) {
        const std::chrono::duration<double> interval = now - *lastArrival;
        intervals.push_back(interval.count());
        if (intervals.size() > config::LATENCY_SAMPLE_CAPACITY) {
            intervals.pop_front();
        }
    }
    lastArrival = now;
}

float LatencyTracker::jitterMs() const {
    if (intervals.size() < 2) {
        return 0.0f;
    }
    double sum = 0.0;
    for (double v : intervals) sum += v;
    const double mean = sum / static_cast<double>(intervals.size());

    double variance = 0.0;
    for (double v : intervals) variance += (v - mean) * (v - mean);
    variance /= static_cast<double>(intervals.size());

    return static_cast<float>(std::sqrt(variance) * 1000.0);
}

} // namespace lxmonitor::monitor
