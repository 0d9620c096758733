#pragma once

#include "file_tree.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace meshshare {

/**
 * Progress snapshot delivered to subscribers
 */
struct TransferProgressUpdate {
    TransferStatus status;
    uint32_t transferred_percent;       // 0..100, rounded down

    TransferProgressUpdate() : status(TransferStatus::Ongoing), transferred_percent(0) {}
    TransferProgressUpdate(TransferStatus s, uint32_t percent) : status(s), transferred_percent(percent) {}
};

/**
 * Bounded single-consumer queue of progress updates.
 *
 * Producers never block: when the queue is full the oldest non-terminal
 * update is dropped. A terminal update is always accepted and closes the
 * channel. The consumer can still drain queued updates after close.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 16);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /**
     * Queue an update without blocking.
     * @return false if the channel is already closed
     */
    bool try_push(const TransferProgressUpdate& update);

    /**
     * Wait up to timeout for the next update.
     * @return false on timeout, or when the channel is closed and drained
     */
    bool pop(TransferProgressUpdate& out, std::chrono::milliseconds timeout);

    // Non-blocking variant of pop
    bool try_pop(TransferProgressUpdate& out);

    void close();
    bool is_closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped_count() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferProgressUpdate> queue_;
    bool closed_;
    uint64_t dropped_;
};

} // namespace meshshare
