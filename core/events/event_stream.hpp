#pragma once

/**
 * @file event_stream.hpp
 * @brief Thread-safe fan-out of outbound conversation messages
 *
 * Architecture:
 * - The request coordinator sends every client-facing message to one EventStream
 * - Each consumer (SSE client, test recorder) gets its own bounded queue
 * - Fan-out is non-blocking: a slow consumer never blocks the request worker
 * - Overflow drops the oldest message per subscriber with a warning log
 *
 * Thread safety:
 * - send() is called from request workers and summary threads
 * - subscribe()/unsubscribe() from HTTP threads
 * - pop() from the consuming thread
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>

#include "i_outbound_channel.hpp"

namespace agentlink {
namespace events {

struct OutboundEvent {
    uint64_t event_id = 0;  // Monotonic per stream, assigned on send
    std::string type;       // Copy of message["type"]
    nlohmann::json message;
};

/**
 * @brief Bounded queue for a single subscriber
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    /**
     * @brief Push an event, dropping the oldest if full. Never blocks.
     *
     * @return false if an older event was dropped to make room, or the queue is closed
     */
    bool push(const OutboundEvent &event);

    /**
     * @brief Pop an event, waiting up to timeout_ms (0 = non-blocking)
     */
    std::optional<OutboundEvent> pop(int timeout_ms = 0);

    std::optional<OutboundEvent> try_pop();

    size_t size() const;
    bool empty() const;
    size_t dropped_count() const;

    // Unblocks waiting consumers
    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<OutboundEvent> queue_;
    size_t dropped_count_;
    bool closed_ = false;
};

/**
 * @brief Subscription handle. RAII: unsubscribes on destruction.
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

    std::optional<OutboundEvent> pop(int timeout_ms = 100);
    std::optional<OutboundEvent> try_pop();

    SubscriptionId id() const;
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Message type filter. Empty = all types.
 */
struct EventFilter {
    std::set<std::string> types;

    bool matches(const OutboundEvent &event) const;

    // Parse a comma-separated list ("tool_use,text_block")
    static EventFilter from_list(const std::string &csv);
    static EventFilter all();
};

/**
 * @brief Outbound channel that fans each message out to all matching subscribers
 *
 * Messages sent while nobody is subscribed are counted and discarded.
 */
class EventStream : public IOutboundChannel {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max messages per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventStream(size_t default_queue_size = 256, size_t max_subscribers = 32);

    /**
     * @brief Subscribe to outbound messages
     *
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // IOutboundChannel
    bool send(const nlohmann::json &message) override;

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;
    bool at_capacity() const;
    uint64_t undelivered_count() const { return undelivered_.load(); }

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    std::atomic<SubscriptionId> next_subscription_id_;
    std::atomic<uint64_t> next_event_id_;
    std::atomic<uint64_t> undelivered_{0};
};

}  // namespace events
}  // namespace agentlink
