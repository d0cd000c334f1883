#include "event_emitter.hpp"

#include <chrono>
#include <type_traits>
#include <utility>

#include "logging/logger.hpp"

namespace tactile {
namespace events {

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name)
    : max_size_(max_size > 0 ? max_size : 1), name_(name) {}

bool SubscriberQueue::push(const Event &event) {
    // Capture log data while locked; log after unlocking.
    bool overflow_now = false;
    size_t depth = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            return false;
        }

        if (queue_.size() >= max_size_) {
            overflowed_ = true;
            closed_ = true;
            overflow_now = true;
            depth = queue_.size();
        } else {
            queue_.push(event);
        }
    }

    cv_.notify_all();

    if (overflow_now) {
        LOG_WARN("[EventEmitter] Queue '" << name_ << "' overflow at " << depth << " events, closing subscriber");
        return false;
    }
    return true;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::optional<Event> event;

    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        event = std::move(queue_.front());
        queue_.pop();
    }

    return event;
}

std::optional<Event> SubscriberQueue::try_pop() { return pop(0); }

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SubscriberQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

bool SubscriberQueue::overflowed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflowed_;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    cv_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(other.id_), queue_(std::move(other.queue_)), unsubscribe_fn_(std::move(other.unsubscribe_fn_)) {
    other.id_ = 0;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = other.id_;
        queue_ = std::move(other.queue_);
        unsubscribe_fn_ = std::move(other.unsubscribe_fn_);
        other.id_ = 0;
    }
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout_ms);
}

std::optional<Event> Subscription::try_pop() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->try_pop();
}

Subscription::SubscriptionId Subscription::id() const { return id_; }

bool Subscription::is_active() const { return queue_ != nullptr && !queue_->is_closed(); }

bool Subscription::overflowed() const { return queue_ != nullptr && queue_->overflowed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

void Subscription::unsubscribe() {
    if (id_ != 0 && unsubscribe_fn_) {
        unsubscribe_fn_(id_);
        id_ = 0;
        if (queue_) {
            queue_->close();
        }
    }
}

bool EventFilter::matches(const Event &event) const {
    if (device_index && get_device_index(event) != *device_index) {
        return false;
    }
    if (!sensor_readings && std::holds_alternative<SensorReadingEvent>(event)) {
        return false;
    }
    return true;
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      next_subscription_id_(1),
      next_event_id_(1) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    SubscriptionId id = 0;
    size_t subscriber_count = 0;
    std::shared_ptr<SubscriberQueue> queue;
    bool rejected = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_) {
            rejected = true;
            subscriber_count = max_subscribers_;
        } else {
            id = next_subscription_id_++;
            const auto actual_queue_size = queue_size > 0 ? queue_size : default_queue_size_;
            queue = std::make_shared<SubscriberQueue>(actual_queue_size, name);

            subscribers_[id] = SubscriberInfo{queue, filter, name};
            subscriber_count = subscribers_.size();
        }
    }

    if (rejected) {
        LOG_WARN("[EventEmitter] Max subscribers (" << subscriber_count << ") reached, rejecting subscription");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscription " << id << " created" << (name.empty() ? "" : " (" + name + ")")
                                             << ", total subscribers: " << subscriber_count);

    auto unsubscribe_fn = [this](SubscriptionId sub_id) { this->unsubscribe(sub_id); };
    return std::make_unique<Subscription>(id, std::move(queue), std::move(unsubscribe_fn));
}

void EventEmitter::emit(Event event) {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t id = next_event_id_++;
    std::visit([id](auto &&e) { e.event_id = id; }, event);

    for (auto &[sub_id, info] : subscribers_) {
        if (!info.filter.matches(event)) {
            continue;
        }
        if (!info.queue->push(event) && info.queue->overflowed()) {
            LOG_DEBUG("[EventEmitter] Subscription " << sub_id << " overflowed");
        }
    }
}

uint64_t EventEmitter::next_event_id() const { return next_event_id_.load(); }

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventEmitter::max_subscribers() const { return max_subscribers_; }

void EventEmitter::unsubscribe(SubscriptionId id) {
    bool found = false;
    size_t remaining = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = subscribers_.find(id);
        if (it != subscribers_.end()) {
            it->second.queue->close();
            subscribers_.erase(it);
            found = true;
            remaining = subscribers_.size();
        }
    }

    if (found) {
        LOG_DEBUG("[EventEmitter] Subscription " << id << " removed, remaining: " << remaining);
    }
}

}  // namespace events
}  // namespace tactile
