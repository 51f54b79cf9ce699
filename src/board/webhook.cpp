/*
 * kanboard C++ - Webhook Sink Implementation
 */
#include <kanboard/board/webhook.hpp>
#include <kanboard/core/logger.hpp>

#include <curl/curl.h>

namespace kanboard {

namespace {

size_t discard_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    (void)ptr;
    (void)userdata;
    return size * nmemb;
}

} // anonymous namespace

WebhookSink::WebhookSink(const std::string& url, int timeout_s)
    : url_(url)
    , timeout_s_(timeout_s > 0 ? timeout_s : 5)
    , events_(nullptr)
    , subscription_(0)
    , delivered_(0)
    , failed_(0) {}

WebhookSink::~WebhookSink() {
    detach();
}

void WebhookSink::attach(EventBroadcaster* events) {
    detach();
    if (!events) return;
    
    events_ = events;
    WebhookSink* self = this;
    subscription_ = events_->subscribe("", [self](const BoardEvent& event) {
        self->deliver(event);
    });
    LOG_INFO("[Webhook] Forwarding board events to %s", url_.c_str());
}

void WebhookSink::detach() {
    if (events_ && subscription_ != 0) {
        events_->unsubscribe(subscription_);
    }
    events_ = nullptr;
    subscription_ = 0;
}

bool WebhookSink::deliver(const BoardEvent& event) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("[Webhook] curl_easy_init failed");
        failed_++;
        return false;
    }
    
    const std::string body = event.to_json().dump();
    
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    const std::string kind_header = "X-Kanboard-Event: " + event.kind;
    headers = curl_slist_append(headers, kind_header.c_str());
    
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    
    if (res != CURLE_OK) {
        LOG_WARN("[Webhook] POST %s failed: %s", url_.c_str(), curl_easy_strerror(res));
        failed_++;
        return false;
    }
    if (status >= 400) {
        LOG_WARN("[Webhook] POST %s returned HTTP %ld for %s #%llu",
                 url_.c_str(), status, event.kind.c_str(),
                 (unsigned long long)event.sequence);
        failed_++;
        return false;
    }
    
    LOG_DEBUG("[Webhook] Delivered %s #%llu (HTTP %ld)",
              event.kind.c_str(), (unsigned long long)event.sequence, status);
    delivered_++;
    return true;
}

} // namespace kanboard
