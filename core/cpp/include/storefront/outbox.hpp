#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <google/protobuf/message.h>
#include "router.hpp"

namespace storefront {

/**
 * Post-commit handoff for order events.
 *
 * The core publishes only after its transaction commits. Publishing must not
 * block on, or fail because of, whatever consumes the events.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * Hand off one event. Never throws.
     */
    virtual void publish(const google::protobuf::Message& event) noexcept = 0;
};

/**
 * In-process outbox: a queue drained by one worker thread into an EventRouter.
 *
 * Side effects (chat message, email, low-stock alert) run on the worker, so
 * no store connection or request thread ever waits on them.
 */
class EventOutbox : public EventSink {
public:
    static constexpr size_t kDefaultCapacity = 10000;

    /**
     * @param capacity Most events held while the worker is behind; later
     *                 publishes are dropped and counted until it catches up.
     */
    explicit EventOutbox(const EventRouter& router, size_t capacity = kDefaultCapacity);

    /**
     * Stops the worker after draining queued events.
     */
    ~EventOutbox() override;

    EventOutbox(const EventOutbox&) = delete;
    EventOutbox& operator=(const EventOutbox&) = delete;

    void publish(const google::protobuf::Message& event) noexcept override;

    /**
     * Block until every event published so far has been dispatched.
     */
    void flush();

    /**
     * Drain the queue and stop the worker. Later publishes are dropped.
     */
    void stop();

    uint64_t published() const { return published_.load(); }
    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void run();

    const EventRouter& router_;
    const size_t capacity_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::deque<v1::EventPage> queue_;
    bool stopping_ = false;
    bool busy_ = false;
    uint64_t next_sequence_ = 1;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};

    std::thread worker_;
};

} // namespace storefront
