#pragma once
#include "lxmonitor/net/NetConfig.hpp"
#include "lxmonitor/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace lxmonitor::net {

/// Outcome of a deadline-bounded transfer.
struct TransferResult {
    error_code ec = asio::error::would_block;
    std::size_t bytes = 0;
};

/**
 * @brief Block the calling thread on one async transfer, bounded by a timer.
 *
 * `start_async(handler)` must start exactly one operation whose completion
 * signature is `(error_code, std::size_t)`. A steady_timer on the same
 * executor races it; the loser is cancelled through `cancel()` and the call
 * returns asio::error::timed_out.
 *
 * Both handlers share the result slot through a shared_ptr, so a late
 * completion after the deadline fired is harmless.
 *
 * The io_context behind `ex` must be running on another thread: calling this
 * from one of its handlers never returns.
 */
template<typename StartAsync, typename Cancel>
TransferResult with_deadline(asio::any_io_executor ex,
                             milliseconds timeout,
                             StartAsync start_async,
                             Cancel cancel)
{
    struct Slot {
        std::mutex m;
        std::condition_variable cv;
        bool settled = false;
        TransferResult result;
    };

    auto slot = std::make_shared<Slot>();
    auto timer = std::make_shared<asio::steady_timer>(ex, timeout);

    start_async([slot, timer](const error_code& ec, std::size_t bytes) {
        {
            std::lock_guard<std::mutex> lk(slot->m);
            if (slot->settled) return;
            slot->result = TransferResult{ec, bytes};
            slot->settled = true;
        }
        slot->cv.notify_one();
        timer->cancel();
    });

    timer->async_wait([slot, cancel, timeout](const error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        {
            std::lock_guard<std::mutex> lk(slot->m);
            if (slot->settled) return;
            slot->result = TransferResult{asio::error::timed_out, 0};
            slot->settled = true;
        }
        logDebug("[Listener] transfer timed out after ", timeout.count(), "ms\n");
        cancel();
        slot->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(slot->m);
    slot->cv.wait(lk, [&]{ return slot->settled; });
    return slot->result;
}

} // namespace lxmonitor::net
