/**
 * event_emitter_test.cpp - EventEmitter and SubscriberQueue unit tests
 *
 * Tests:
 * 1. Basic subscription lifecycle (subscribe, emit, pop, unsubscribe)
 * 2. Queue overflow handling (closes and flags the subscriber, never drops silently)
 * 3. Multiple subscriber isolation (slow subscriber doesn't block others)
 * 4. Timeout and blocking behavior (pop with timeout, try_pop)
 * 5. Event filtering (device index, lifecycle-only)
 * 6. Subscriber limit enforcement (max_subscribers)
 * 7. RAII cleanup (Subscription destructor unsubscribes)
 * 8. Event ID monotonicity
 * 9. Thread-safety (concurrent emit, subscribe, unsubscribe)
 */

#include "events/event_emitter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "events/event_types.hpp"

using namespace tactile;
using namespace tactile::events;
using namespace std::chrono_literals;

/**
 * Helper: Create a test DeviceAddedEvent
 */
DeviceAddedEvent create_added_event(device::DeviceIndex index = 0, const std::string &name = "LVS-Z36") {
    DeviceAddedEvent evt;
    evt.device_index = index;
    evt.device_name = name;
    evt.capabilities.actuators.push_back(
        device::ActuatorDescriptor{device::ActuatorKind::VIBRATE, 0, device::ValueRange{}, 20, "tx"});
    evt.timestamp_ms = 1234567890;
    evt.event_id = 0;  // Will be assigned by emitter
    return evt;
}

/**
 * Helper: Create a test SensorReadingEvent
 */
SensorReadingEvent create_reading_event(device::DeviceIndex index = 0, double value = 0.5) {
    SensorReadingEvent evt;
    evt.device_index = index;
    evt.readings.push_back(device::SensorReading{device::SensorKind::BATTERY, 0, value});
    evt.timestamp_ms = 1234567890;
    evt.event_id = 0;
    return evt;
}

// ============================================================================
// Basic Subscription Tests
// ============================================================================

TEST(EventEmitterTest, SubscribeAndEmit) {
    EventEmitter emitter(10);  // Small queue for testing

    auto sub = emitter.subscribe();
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_active());

    emitter.emit(create_added_event(3, "CycSA"));

    auto received = sub->pop(100);
    ASSERT_TRUE(received.has_value());

    ASSERT_TRUE(std::holds_alternative<DeviceAddedEvent>(*received));
    auto &added = std::get<DeviceAddedEvent>(*received);
    EXPECT_EQ(added.device_index, 3u);
    EXPECT_EQ(added.device_name, "CycSA");
    ASSERT_EQ(added.capabilities.actuators.size(), 1u);
    EXPECT_EQ(added.capabilities.actuators[0].kind, device::ActuatorKind::VIBRATE);
}

TEST(EventEmitterTest, MultipleSubscribers) {
    EventEmitter emitter;

    auto sub1 = emitter.subscribe(EventFilter::all(), 0, "sub1");
    auto sub2 = emitter.subscribe(EventFilter::all(), 0, "sub2");
    auto sub3 = emitter.subscribe(EventFilter::all(), 0, "sub3");

    EXPECT_EQ(emitter.subscriber_count(), 3u);

    emitter.emit(create_reading_event(1, 0.25));

    // All subscribers should receive it
    for (auto *sub : {sub1.get(), sub2.get(), sub3.get()}) {
        auto evt = sub->pop(100);
        ASSERT_TRUE(evt.has_value());
        const auto &reading = std::get<SensorReadingEvent>(*evt);
        ASSERT_EQ(reading.readings.size(), 1u);
        EXPECT_DOUBLE_EQ(reading.readings[0].value, 0.25);
    }
}

TEST(EventEmitterTest, UnsubscribeRemovesSubscriber) {
    EventEmitter emitter;

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    EXPECT_EQ(emitter.subscriber_count(), 2u);

    sub1->unsubscribe();
    EXPECT_EQ(emitter.subscriber_count(), 1u);
    EXPECT_FALSE(sub1->is_active());

    emitter.emit(create_added_event());

    EXPECT_FALSE(sub1->try_pop().has_value());  // sub1 unsubscribed
    EXPECT_TRUE(sub2->pop(100).has_value());    // sub2 still active
}

TEST(EventEmitterTest, SubscriptionRAIICleanup) {
    EventEmitter emitter;

    {
        auto sub = emitter.subscribe();
        EXPECT_EQ(emitter.subscriber_count(), 1u);
    }

    EXPECT_EQ(emitter.subscriber_count(), 0u);
}

TEST(EventEmitterTest, MovedSubscriptionUnsubscribesOnce) {
    EventEmitter emitter;

    auto sub = emitter.subscribe();
    ASSERT_NE(sub, nullptr);
    {
        Subscription moved(std::move(*sub));
        EXPECT_EQ(emitter.subscriber_count(), 1u);
        emitter.emit(create_added_event());
        EXPECT_TRUE(moved.try_pop().has_value());
    }
    EXPECT_EQ(emitter.subscriber_count(), 0u);

    // Moved-from handle is inert
    EXPECT_FALSE(sub->is_active());
    EXPECT_FALSE(sub->try_pop().has_value());
}

// ============================================================================
// Queue Overflow Tests
// ============================================================================

TEST(EventEmitterTest, QueueOverflowClosesSubscriber) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::all(), 3);  // Queue size = 3

    emitter.emit(create_added_event(0));
    emitter.emit(create_added_event(1));
    emitter.emit(create_added_event(2));

    EXPECT_EQ(sub->queue_size(), 3u);
    EXPECT_FALSE(sub->overflowed());
    EXPECT_TRUE(sub->is_active());

    // One more than fits
    emitter.emit(create_added_event(3));

    EXPECT_TRUE(sub->overflowed());
    EXPECT_FALSE(sub->is_active());
    EXPECT_EQ(sub->queue_size(), 3u);

    // Already queued events still drain, in order
    for (device::DeviceIndex expected = 0; expected < 3; ++expected) {
        auto evt = sub->pop(100);
        ASSERT_TRUE(evt.has_value());
        EXPECT_EQ(get_device_index(*evt), expected);
    }
    EXPECT_FALSE(sub->pop(10).has_value());
}

TEST(EventEmitterTest, NothingAcceptedAfterOverflow) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::all(), 2);

    for (int i = 0; i < 10; ++i) {
        emitter.emit(create_added_event(static_cast<device::DeviceIndex>(i)));
    }

    EXPECT_TRUE(sub->overflowed());
    EXPECT_EQ(sub->queue_size(), 2u);
}

TEST(SubscriberQueueTest, PushAfterCloseIsRejected) {
    SubscriberQueue queue(4, "q");
    EXPECT_TRUE(queue.push(create_added_event()));

    queue.close();
    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(create_added_event()));
    EXPECT_FALSE(queue.overflowed());

    // Closing does not discard what was queued
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_TRUE(queue.pop(0).has_value());
    EXPECT_TRUE(queue.empty());
}

// ============================================================================
// Subscriber Isolation Tests
// ============================================================================

TEST(EventEmitterTest, SlowSubscriberDoesNotBlockEmit) {
    EventEmitter emitter;

    // Never pops
    auto slow_sub = emitter.subscribe(EventFilter::all(), 5, "slow");
    auto fast_sub = emitter.subscribe(EventFilter::all(), 100, "fast");

    for (int i = 0; i < 10; ++i) {
        emitter.emit(create_reading_event(0, i / 10.0));
    }

    EXPECT_TRUE(slow_sub->overflowed());

    EXPECT_EQ(fast_sub->queue_size(), 10u);
    EXPECT_FALSE(fast_sub->overflowed());
    EXPECT_TRUE(fast_sub->is_active());
}

// ============================================================================
// Timeout and Blocking Tests
// ============================================================================

TEST(EventEmitterTest, PopBlocksUntilEventAvailable) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    // Scale timing for sanitizer builds (2-10x overhead)
#if defined(__SANITIZE_THREAD__) || defined(__SANITIZE_ADDRESS__)
    const auto emit_delay = 100ms;
    const int timeout_ms = 500;
    const auto min_elapsed = 50ms;
    const auto max_elapsed = 400ms;
#else
    const auto emit_delay = 50ms;
    const int timeout_ms = 200;
    const auto min_elapsed = 40ms;
    const auto max_elapsed = 150ms;
#endif

    std::thread emitter_thread([&emitter, emit_delay]() {
        std::this_thread::sleep_for(emit_delay);
        emitter.emit(create_added_event());
    });

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(timeout_ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(event.has_value());
    EXPECT_GE(elapsed, min_elapsed);
    EXPECT_LT(elapsed, max_elapsed);

    emitter_thread.join();
}

TEST(EventEmitterTest, PopTimesOutIfNoEvent) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(50);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(elapsed, 40ms);
}

TEST(EventEmitterTest, CloseWakesBlockedPop) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    std::thread closer([&sub]() {
        std::this_thread::sleep_for(30ms);
        sub->unsubscribe();
    });

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(2000);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(event.has_value());
    EXPECT_LT(elapsed, 1000ms);

    closer.join();
}

TEST(EventEmitterTest, TryPopReturnsImmediately) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    auto start = std::chrono::steady_clock::now();
    auto event = sub->try_pop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(event.has_value());
    EXPECT_LT(elapsed, 10ms);
}

// ============================================================================
// Event Filtering Tests
// ============================================================================

TEST(EventEmitterTest, FilterByDeviceIndex) {
    EventEmitter emitter;

    EventFilter filter;
    filter.device_index = 1;

    auto sub = emitter.subscribe(filter);

    emitter.emit(create_added_event(0));
    emitter.emit(create_added_event(1));
    emitter.emit(create_reading_event(2));

    auto evt = sub->pop(100);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(get_device_index(*evt), 1u);

    EXPECT_FALSE(sub->try_pop().has_value());
}

TEST(EventEmitterTest, LifecycleOnlyFilterSkipsReadings) {
    EventEmitter emitter;

    EventFilter filter;
    filter.sensor_readings = false;

    auto sub = emitter.subscribe(filter);

    emitter.emit(create_reading_event(0));
    emitter.emit(create_added_event(0));

    DeviceRemovedEvent removed;
    removed.device_index = 0;
    removed.device_name = "LVS-Z36";
    emitter.emit(removed);

    auto first = sub->pop(100);
    auto second = sub->pop(100);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::holds_alternative<DeviceAddedEvent>(*first));
    EXPECT_TRUE(std::holds_alternative<DeviceRemovedEvent>(*second));

    EXPECT_FALSE(sub->try_pop().has_value());
}

// ============================================================================
// Max Subscribers Tests
// ============================================================================

TEST(EventEmitterTest, MaxSubscriberLimitEnforced) {
    EventEmitter emitter(100, 3);

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    auto sub3 = emitter.subscribe();

    EXPECT_EQ(emitter.subscriber_count(), 3u);
    EXPECT_EQ(emitter.max_subscribers(), 3u);

    auto sub4 = emitter.subscribe();
    EXPECT_EQ(sub4, nullptr);
    EXPECT_EQ(emitter.subscriber_count(), 3u);
}

TEST(EventEmitterTest, UnsubscribeFreesCapacity) {
    EventEmitter emitter(100, 2);

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    EXPECT_EQ(emitter.subscribe(), nullptr);

    sub1->unsubscribe();

    auto sub3 = emitter.subscribe();
    EXPECT_NE(sub3, nullptr);
}

TEST(EventEmitterTest, ZeroMeansUnlimitedSubscribers) {
    EventEmitter emitter(8, 0);

    std::vector<std::unique_ptr<Subscription>> subs;
    for (int i = 0; i < 64; ++i) {
        subs.push_back(emitter.subscribe());
        ASSERT_NE(subs.back(), nullptr);
    }
    EXPECT_EQ(emitter.subscriber_count(), 64u);
}

// ============================================================================
// Event ID Monotonicity Tests
// ============================================================================

TEST(EventEmitterTest, EventIDsAreMonotonic) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    for (int i = 0; i < 5; ++i) {
        emitter.emit(create_reading_event());
    }

    uint64_t prev_id = 0;
    for (int i = 0; i < 5; ++i) {
        auto evt = sub->pop(100);
        ASSERT_TRUE(evt.has_value());

        uint64_t event_id = get_event_id(*evt);

        EXPECT_GT(event_id, prev_id);
        prev_id = event_id;
    }
}

// ============================================================================
// Thread-Safety Tests
// ============================================================================

TEST(EventEmitterTest, ConcurrentEmittersPreserveOneOrderForAllSubscribers) {
    constexpr int kEmitters = 4;
    constexpr int kEventsPerEmitter = 50;

    EventEmitter emitter(kEmitters * kEventsPerEmitter);
    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();

    std::vector<std::thread> threads;
    for (int t = 0; t < kEmitters; ++t) {
        threads.emplace_back([&emitter, t]() {
            for (int i = 0; i < kEventsPerEmitter; ++i) {
                emitter.emit(create_added_event(static_cast<device::DeviceIndex>(t)));
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    // Both subscribers observe identical event id sequences
    for (int i = 0; i < kEmitters * kEventsPerEmitter; ++i) {
        auto a = sub1->try_pop();
        auto b = sub2->try_pop();
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        EXPECT_EQ(get_event_id(*a), get_event_id(*b));
    }
}

TEST(EventEmitterTest, UnsubscribeDuringEmission) {
    EventEmitter emitter;

    std::vector<std::unique_ptr<Subscription>> subs;
    subs.reserve(5);
    for (int i = 0; i < 5; ++i) {
        subs.push_back(emitter.subscribe());
    }

    std::thread emitter_thread([&emitter]() {
        for (int i = 0; i < 50; ++i) {
            emitter.emit(create_reading_event());
            std::this_thread::sleep_for(2ms);
        }
    });

    std::thread unsubscriber_thread([&subs]() {
        std::this_thread::sleep_for(10ms);
        for (auto &sub : subs) {
            sub->unsubscribe();
            std::this_thread::sleep_for(5ms);
        }
    });

    emitter_thread.join();
    unsubscriber_thread.join();

    EXPECT_EQ(emitter.subscriber_count(), 0u);
}
