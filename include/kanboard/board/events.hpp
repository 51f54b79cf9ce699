/*
 * kanboard C++ - Event Broadcaster
 * 
 * Best-effort fan-out of board-changed notifications. publish() only
 * enqueues; a dispatcher thread delivers to subscribers in publish order.
 * When the bounded queue is full the oldest event is dropped (and counted):
 * subscribers can always re-read the board.
 */
#ifndef kanboard_BOARD_EVENTS_HPP
#define kanboard_BOARD_EVENTS_HPP

#include <kanboard/core/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <cstdint>

namespace kanboard {

struct BoardEvent {
    uint64_t sequence;
    std::string board;
    std::string kind;           // "task-moved", "board-cleared", ...
    Json payload;
    int64_t timestamp;
    
    BoardEvent() : sequence(0), timestamp(0) {}
    
    Json to_json() const;
};

typedef std::function<void(const BoardEvent&)> EventHandler;

class EventBroadcaster {
public:
    explicit EventBroadcaster(size_t queue_size = 1024);
    ~EventBroadcaster();
    
    void start();
    void stop();
    bool is_running() const { return running_.load(); }
    
    // Empty board = every board. Returns a subscription id.
    uint64_t subscribe(const std::string& board, EventHandler handler);
    void unsubscribe(uint64_t id);
    size_t subscriber_count() const;
    
    void publish(const std::string& board, const std::string& kind, const Json& payload);
    
    // Wait until every queued event was delivered (true) or timeout (false)
    bool flush(int timeout_ms);
    
    uint64_t published() const { return published_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    struct Subscription {
        std::string board;
        EventHandler handler;
    };
    
    size_t queue_size_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> published_;
    std::atomic<uint64_t> dropped_;
    uint64_t next_sequence_;
    uint64_t next_subscription_;
    bool delivering_;
    
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<BoardEvent> queue_;
    
    mutable std::mutex subs_mutex_;
    std::mutex deliver_mutex_;
    std::map<uint64_t, Subscription> subscriptions_;
    
    std::thread dispatcher_;
    
    void dispatch_loop();
    void deliver(const BoardEvent& event);
};

} // namespace kanboard

#endif // kanboard_BOARD_EVENTS_HPP
