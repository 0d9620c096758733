#include "progress_channel.h"

namespace meshshare {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), closed_(false), dropped_(0) {
}

bool ProgressChannel::try_push(const TransferProgressUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        bool terminal = is_terminal_status(update.status);

        if (queue_.size() >= capacity_) {
            // Queue never holds a terminal update while open, so the front is droppable
            queue_.pop_front();
            dropped_++;
        }

        queue_.push_back(update);
        if (terminal) {
            closed_ = true;
        }
    }
    cv_.notify_all();
    return true;
}

bool ProgressChannel::pop(TransferProgressUpdate& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return false;
    }

    out = queue_.front();
    queue_.pop_front();
    return true;
}

bool ProgressChannel::try_pop(TransferProgressUpdate& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }

    out = queue_.front();
    queue_.pop_front();
    return true;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t ProgressChannel::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace meshshare
