/*
 * kanboard C++ - Event Broadcaster Implementation
 */
#include <kanboard/board/events.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

#include <chrono>
#include <vector>

namespace kanboard {

Json BoardEvent::to_json() const {
    Json j;
    j["sequence"] = sequence;
    j["board"] = board;
    j["event"] = kind;
    j["data"] = payload;
    j["timestamp"] = format_timestamp_ms(timestamp);
    return j;
}

EventBroadcaster::EventBroadcaster(size_t queue_size)
    : queue_size_(queue_size > 0 ? queue_size : 1)
    , running_(false)
    , published_(0)
    , dropped_(0)
    , next_sequence_(1)
    , next_subscription_(1)
    , delivering_(false) {}

EventBroadcaster::~EventBroadcaster() {
    stop();
}

void EventBroadcaster::start() {
    if (running_.exchange(true)) return;
    dispatcher_ = std::thread(&EventBroadcaster::dispatch_loop, this);
    LOG_DEBUG("[Events] Dispatcher started (queue size %zu)", queue_size_);
}

void EventBroadcaster::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_cv_.notify_all();
    }
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    LOG_DEBUG("[Events] Dispatcher stopped (%llu published, %llu dropped)",
              (unsigned long long)published_.load(), (unsigned long long)dropped_.load());
}

uint64_t EventBroadcaster::subscribe(const std::string& board, EventHandler handler) {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    uint64_t id = next_subscription_++;
    Subscription sub;
    sub.board = board;
    sub.handler = handler;
    subscriptions_[id] = sub;
    return id;
}

void EventBroadcaster::unsubscribe(uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        subscriptions_.erase(id);
    }
    // Wait out an in-flight delivery so the handler is never called afterwards
    if (std::this_thread::get_id() != dispatcher_.get_id()) {
        std::lock_guard<std::mutex> wait(deliver_mutex_);
    }
}

size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    return subscriptions_.size();
}

void EventBroadcaster::publish(const std::string& board, const std::string& kind, const Json& payload) {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    BoardEvent event;
    event.sequence = next_sequence_++;
    event.board = board;
    event.kind = kind;
    event.payload = payload;
    event.timestamp = current_timestamp_ms();

    if (queue_.size() >= queue_size_) {
        LOG_WARN("[Events] Queue full, dropping event #%llu (%s)",
                 (unsigned long long)queue_.front().sequence, queue_.front().kind.c_str());
        queue_.pop_front();
        dropped_++;
    }
    queue_.push_back(event);
    published_++;
    queue_cv_.notify_one();
}

bool EventBroadcaster::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return queue_.empty() && !delivering_;
    });
}

void EventBroadcaster::dispatch_loop() {
    for (;;) {
        BoardEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (queue_.empty()) {
                // Stopped with nothing left to deliver
                idle_cv_.notify_all();
                return;
            }
            event = queue_.front();
            queue_.pop_front();
            delivering_ = true;
        }

        {
            std::lock_guard<std::mutex> lock(deliver_mutex_);
            deliver(event);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            delivering_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
    }
}

void EventBroadcaster::deliver(const BoardEvent& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        for (std::map<uint64_t, Subscription>::const_iterator it = subscriptions_.begin();
             it != subscriptions_.end(); ++it) {
            if (it->second.board.empty() || it->second.board == event.board) {
                handlers.push_back(it->second.handler);
            }
        }
    }

    for (size_t i = 0; i < handlers.size(); ++i) {
        try {
            handlers[i](event);
        } catch (const std::exception& e) {
            LOG_ERROR("[Events] Subscriber failed on %s #%llu: %s",
                      event.kind.c_str(), (unsigned long long)event.sequence, e.what());
        }
    }
}

} // namespace kanboard
