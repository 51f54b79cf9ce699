/*
 * kanboard C++ - Webhook Sink
 * 
 * Forwards every board event as a JSON POST to a configured URL. Delivery
 * runs on the broadcaster's dispatcher thread; failures are logged and the
 * event is not retried.
 */
#ifndef kanboard_BOARD_WEBHOOK_HPP
#define kanboard_BOARD_WEBHOOK_HPP

#include <kanboard/board/events.hpp>
#include <atomic>
#include <string>
#include <cstdint>

namespace kanboard {

class WebhookSink {
public:
    WebhookSink(const std::string& url, int timeout_s);
    ~WebhookSink();
    
    // Subscribe to every board on the broadcaster
    void attach(EventBroadcaster* events);
    void detach();
    
    // POST one event; false when the request failed or returned >= 400
    bool deliver(const BoardEvent& event);
    
    const std::string& url() const { return url_; }
    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    std::string url_;
    long timeout_s_;
    EventBroadcaster* events_;
    uint64_t subscription_;
    std::atomic<uint64_t> delivered_;
    std::atomic<uint64_t> failed_;
};

} // namespace kanboard

#endif // kanboard_BOARD_WEBHOOK_HPP
