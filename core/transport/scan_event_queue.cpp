#include "scan_event_queue.hpp"

#include <chrono>
#include <utility>

namespace tactile {
namespace transport {

ScanEventQueue::ScanEventQueue(size_t max_size) : max_size_(max_size > 0 ? max_size : 1) {}

bool ScanEventQueue::push(ScanEvent event, int timeout_ms) {
    {
        std::unique_lock<std::mutex> lock(mutex_);

        auto has_space = [this] { return closed_ || queue_.size() < max_size_; };
        if (timeout_ms > 0) {
            not_full_.wait_for(lock, std::chrono::milliseconds(timeout_ms), has_space);
        }

        if (closed_ || queue_.size() >= max_size_) {
            return false;
        }

        queue_.push_back(std::move(event));
    }

    not_empty_.notify_one();
    return true;
}

std::optional<ScanEvent> ScanEventQueue::pop(int timeout_ms) {
    std::optional<ScanEvent> event;

    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (timeout_ms > 0) {
            not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this] { return !queue_.empty() || closed_; });
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        event = std::move(queue_.front());
        queue_.pop_front();
    }

    not_full_.notify_one();
    return event;
}

void ScanEventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    not_empty_.notify_all();
    not_full_.notify_all();
}

bool ScanEventQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ScanEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace transport
}  // namespace tactile
