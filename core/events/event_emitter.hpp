#pragma once

/**
 * @file event_emitter.hpp
 * @brief Thread-safe fan-out event dispatcher with per-subscriber queues
 *
 * Architecture:
 * - DeviceManager emits lifecycle and sensor events to a single EventEmitter
 * - Each subscriber (one per client session) gets its own bounded queue
 * - Fan-out is non-blocking: a slow subscriber never blocks the registry
 * - Overflow never drops silently: the overflowing queue is closed and flagged,
 *   and its owner is expected to tear the subscriber down
 *
 * Thread safety:
 * - emit() is called from the discovery pump and from command dispatch
 * - subscribe()/unsubscribe() called from session setup/teardown
 * - pop() called from each session's event thread
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>

#include "event_types.hpp"

namespace tactile {
namespace events {

/**
 * @brief Bounded event queue for a single subscriber
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    /**
     * @brief Push event to queue (producer side)
     *
     * Never blocks. If the queue is full it is closed and marked overflowed;
     * the event and everything after it are rejected.
     *
     * @return true if queued
     */
    bool push(const Event &event);

    /**
     * @brief Pop event from queue (consumer side)
     *
     * Blocks until an event is available, the queue is closed, or timeout expires.
     * Events queued before close are still delivered.
     *
     * @param timeout_ms Max time to wait (0 = non-blocking)
     */
    std::optional<Event> pop(int timeout_ms = 0);

    std::optional<Event> try_pop();

    size_t size() const;
    bool empty() const;

    bool overflowed() const;

    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Event> queue_;
    bool overflowed_ = false;
    bool closed_ = false;
};

/**
 * @brief Subscription handle returned to subscribers
 *
 * RAII: unsubscribes automatically on destruction.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop();

    SubscriptionId id() const;

    // False once unsubscribed, closed, or overflowed
    bool is_active() const;
    bool overflowed() const;

    size_t queue_size() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Event filter for subscribers
 *
 * Empty filter = receive all events.
 */
struct EventFilter {
    std::optional<device::DeviceIndex> device_index;  // Empty = all devices
    bool sensor_readings = true;                      // false = lifecycle events only

    bool matches(const Event &event) const;

    static EventFilter all();
};

/**
 * @brief Thread-safe event emitter with fan-out to per-subscriber queues
 */
class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max events per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 256, size_t max_subscribers = 0);

    /**
     * @brief Subscribe to events
     *
     * @param filter Event filter (empty = all events)
     * @param queue_size Override default queue size (0 = use default)
     * @param name Debug name for logging
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    /**
     * @brief Emit event to all matching subscribers
     *
     * Assigns a monotonic event_id before fan-out.
     */
    void emit(Event event);

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    // Held across fan-out so every subscriber sees the same event order
    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    std::atomic<SubscriptionId> next_subscription_id_;
    std::atomic<uint64_t> next_event_id_;
};

}  // namespace events
}  // namespace tactile
