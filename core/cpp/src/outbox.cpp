#include "storefront/outbox.hpp"
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"

#include <exception>

namespace storefront {

EventOutbox::EventOutbox(const EventRouter& router, size_t capacity)
    : router_(router), capacity_(capacity) {
    worker_ = std::thread([this] { run(); });
}

EventOutbox::~EventOutbox() {
    stop();
}

void EventOutbox::publish(const google::protobuf::Message& event) noexcept {
    try {
        v1::EventPage page;
        page.mutable_event()->PackFrom(event, helpers::TYPE_URL_PREFIX);
        *page.mutable_created_at() = helpers::now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                ++dropped_;
                log_warn("outbox", "event_dropped",
                         {{"event_type", event.GetTypeName()}, {"reason", "outbox stopped"}});
                return;
            }
            if (queue_.size() >= capacity_) {
                ++dropped_;
                log_warn("outbox", "event_dropped",
                         {{"event_type", event.GetTypeName()}, {"reason", "outbox full"},
                          {"capacity", capacity_}});
                return;
            }
            page.set_sequence(next_sequence_++);
            queue_.push_back(std::move(page));
            ++published_;
        }
        wake_.notify_one();
    } catch (const std::exception& e) {
        ++dropped_;
        log_error("outbox", "event_dropped",
                  {{"event_type", event.GetTypeName()}, {"error", e.what()}});
    }
}

void EventOutbox::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void EventOutbox::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) worker_.join();
}

void EventOutbox::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) break;  // stopping and drained

        auto page = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        auto result = router_.dispatch(page);
        delivered_ += result.invoked - result.failed;
        failed_ += result.failed;

        lock.lock();
        busy_ = false;
        if (queue_.empty()) drained_.notify_all();
    }
    drained_.notify_all();
}

} // namespace storefront
