#include "event_stream.hpp"

#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace agentlink {
namespace events {

namespace {

// First overflow of a queue, then every 100th
bool should_report_drop(size_t dropped_total) { return dropped_total % 100 == 1; }

std::string trim_spaces(const std::string &s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

//=============================================================================
// SubscriberQueue
//=============================================================================

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name)
    : max_size_(max_size == 0 ? 1 : max_size), name_(name), dropped_count_(0) {}

bool SubscriberQueue::push(const OutboundEvent &event) {
    size_t dropped_total = 0;
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        while (queue_.size() >= max_size_) {
            queue_.pop();
            dropped_total = ++dropped_count_;
            kept_all = false;
        }
        queue_.push(event);
    }
    cv_.notify_one();

    if (!kept_all && should_report_drop(dropped_total)) {
        LOG_WARN("[EventStream] Subscriber '" << name_ << "' is falling behind, " << dropped_total
                                              << " messages dropped so far");
    }
    return kept_all;
}

std::optional<OutboundEvent> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty() && timeout_ms > 0 && !closed_) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    OutboundEvent event = std::move(queue_.front());
    queue_.pop();
    return event;
}

std::optional<OutboundEvent> SubscriberQueue::try_pop() { return pop(0); }

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SubscriberQueue::empty() const { return size() == 0; }

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
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

//=============================================================================
// Subscription
//=============================================================================

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(std::exchange(other.id_, 0)),
      queue_(std::move(other.queue_)),
      unsubscribe_fn_(std::move(other.unsubscribe_fn_)) {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = std::exchange(other.id_, 0);
        queue_ = std::move(other.queue_);
        unsubscribe_fn_ = std::move(other.unsubscribe_fn_);
    }
    return *this;
}

std::optional<OutboundEvent> Subscription::pop(int timeout_ms) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout_ms);
}

std::optional<OutboundEvent> Subscription::try_pop() { return pop(0); }

Subscription::SubscriptionId Subscription::id() const { return id_; }

bool Subscription::is_active() const { return queue_ && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (unsubscribe_fn_) {
        unsubscribe_fn_(id_);
    }
    id_ = 0;
    if (queue_) {
        queue_->close();
    }
}

//=============================================================================
// EventFilter
//=============================================================================

bool EventFilter::matches(const OutboundEvent &event) const { return types.empty() || types.count(event.type) > 0; }

EventFilter EventFilter::from_list(const std::string &csv) {
    EventFilter filter;
    std::istringstream in(csv);
    std::string item;
    while (std::getline(in, item, ',')) {
        std::string type = trim_spaces(item);
        if (!type.empty()) {
            filter.types.insert(type);
        }
    }
    return filter;
}

EventFilter EventFilter::all() { return EventFilter{}; }

//=============================================================================
// EventStream
//=============================================================================

EventStream::EventStream(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      next_subscription_id_(1),
      next_event_id_(1) {}

std::unique_ptr<Subscription> EventStream::subscribe(const EventFilter &filter, size_t queue_size,
                                                     const std::string &name) {
    SubscriptionId id = 0;
    std::shared_ptr<SubscriberQueue> queue;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = subscribers_.size();
        if (max_subscribers_ == 0 || total < max_subscribers_) {
            id = next_subscription_id_++;
            queue = std::make_shared<SubscriberQueue>(queue_size > 0 ? queue_size : default_queue_size_, name);
            subscribers_.emplace(id, SubscriberInfo{queue, filter, name});
            total = subscribers_.size();
        }
    }

    if (!queue) {
        LOG_WARN("[EventStream] Rejecting subscriber" << (name.empty() ? "" : " '" + name + "'") << ": limit of "
                                                      << max_subscribers_ << " reached");
        return nullptr;
    }

    LOG_DEBUG("[EventStream] Subscriber " << id << (name.empty() ? "" : " (" + name + ")") << " added, " << total
                                          << " active");
    return std::make_unique<Subscription>(id, std::move(queue),
                                          [this](SubscriptionId sub_id) { unsubscribe(sub_id); });
}

bool EventStream::send(const nlohmann::json &message) {
    OutboundEvent event;
    event.message = message;
    if (message.is_object()) {
        auto type = message.find("type");
        if (type != message.end() && type->is_string()) {
            event.type = type->get<std::string>();
        }
    }

    size_t delivered = 0;
    {
        // Id assignment and the pushes share one lock so every queue sees send order
        std::lock_guard<std::mutex> lock(mutex_);
        event.event_id = next_event_id_++;
        for (auto &entry : subscribers_) {
            if (entry.second.filter.matches(event)) {
                entry.second.queue->push(event);
                ++delivered;
            }
        }
    }

    if (delivered == 0) {
        undelivered_++;
        LOG_DEBUG("[EventStream] '" << event.type << "' (#" << event.event_id << ") had no subscriber");
        return false;
    }
    return true;
}

uint64_t EventStream::next_event_id() const { return next_event_id_.load(); }

size_t EventStream::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventStream::max_subscribers() const { return max_subscribers_; }

bool EventStream::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventStream::unsubscribe(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> queue;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        queue = std::move(it->second.queue);
        subscribers_.erase(it);
        remaining = subscribers_.size();
    }
    queue->close();
    LOG_DEBUG("[EventStream] Subscriber " << id << " removed, " << remaining << " active");
}

}  // namespace events
}  // namespace agentlink
