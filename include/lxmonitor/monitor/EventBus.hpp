#pragma once

#include "lxmonitor/core/Expected.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace lxmonitor::monitor {

struct RecvError {
    enum class Kind : std::uint8_t {
        Empty,   // nothing new (tryReceive only)
        Timeout, // nothing new within the wait (receive only)
        Lagged,  // the subscriber fell behind; `missed` events were dropped
        Closed,  // the bus is gone and everything published has been read
    };
    Kind kind = Kind::Empty;
    std::uint64_t missed = 0;
};

/**
 * @brief Bounded multi-subscriber broadcast channel.
 *
 * One ring of `capacity` events is shared by all subscribers. Publishing
 * never blocks: when the ring is full the oldest event is dropped. A
 * subscriber whose cursor points at a dropped event gets a single Lagged
 * error carrying the number of events it missed, then resumes at the oldest
 * event still buffered.
 */
template <typename Event>
class EventBus {
    struct State {
        explicit State(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

        std::mutex m;
        std::condition_variable cv;
        std::deque<Event> ring;
        std::uint64_t headSeq = 0; // sequence number of ring.front()
        std::uint64_t tailSeq = 0; // sequence number of the next publish
        std::size_t capacity;
        bool closed = false;
    };

public:
    class Subscription {
    public:
        using Result = expected<Event, RecvError>;

        /// Non-blocking receive.
        Result tryReceive() {
            std::lock_guard<std::mutex> lk(state->m);
            return take();
        }

        /// Wait up to `timeout` for the next event.
        template <typename Rep, typename Period>
        Result receive(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lk(state->m);
            state->cv.wait_for(lk, timeout, [this]{
                return state->closed || nextSeq != state->tailSeq;
            });
            auto result = take();
            if (!result && result.error().kind == RecvError::Kind::Empty) {
                return unexpected(RecvError{RecvError::Kind::Timeout, 0});
            }
            return result;
        }

    private:
        friend class EventBus;

        explicit Subscription(std::shared_ptr<State> s)
        : state(std::move(s)), nextSeq(state->tailSeq) {}

        // Caller holds state->m.
        Result take() {
            if (nextSeq < state->headSeq) {
                const auto missed = state->headSeq - nextSeq;
                nextSeq = state->headSeq;
                return unexpected(RecvError{RecvError::Kind::Lagged, missed});
            }
            if (nextSeq == state->tailSeq) {
                return unexpected(RecvError{
                    state->closed ? RecvError::Kind::Closed : RecvError::Kind::Empty, 0});
            }
            Event event = state->ring[static_cast<std::size_t>(nextSeq - state->headSeq)];
            ++nextSeq;
            return event;
        }

        std::shared_ptr<State> state;
        std::uint64_t nextSeq;
    };

    explicit EventBus(std::size_t capacity)
    : state(std::make_shared<State>(capacity)) {}

    ~EventBus() { close(); }

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Receives only events published after this call.
    Subscription subscribe() {
        std::lock_guard<std::mutex> lk(state->m);
        return Subscription(state);
    }

    void publish(Event event) {
        {
            std::lock_guard<std::mutex> lk(state->m);
            if (state->closed) return;
            if (state->ring.size() == state->capacity) {
                state->ring.pop_front();
                ++state->headSeq;
            }
            state->ring.push_back(std::move(event));
            ++state->tailSeq;
        }
        state->cv.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(state->m);
            state->closed = true;
        }
        state->cv.notify_all();
    }

    std::size_t capacity() const { return state->capacity; }

private:
    std::shared_ptr<State> state;
};

} // namespace lxmonitor::monitor
