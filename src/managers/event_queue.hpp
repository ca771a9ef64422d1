#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>
#include <core/types.hpp>

// Presentation boundary: receives session output and transfer progress.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_session_event(const SessionEvent& event) = 0;
    virtual void on_transfer_event(const TransferEvent& event) = 0;
};

// Bounded FIFO in front of a downstream sink, drained by one dispatcher
// thread. A full queue blocks producers until the sink catches up or the
// queue stops; every accepted event is delivered. Waits longer than
// stall_warn_ms are logged.
class EventQueue : public EventSink {
public:
    explicit EventQueue(EventSettings settings = {});
    ~EventQueue() override;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Downstream may be swapped at any time; null discards events.
    void set_sink(std::shared_ptr<EventSink> sink);

    void on_session_event(const SessionEvent& event) override;
    void on_transfer_event(const TransferEvent& event) override;

    // Block until every queued event has been delivered.
    void flush();

    // Deliver what is queued, then stop the dispatcher.
    void stop();

    // Number of pushes that waited longer than stall_warn_ms.
    size_t stalls() const { return stalls_.load(); }

private:
    using Event = std::variant<SessionEvent, TransferEvent>;

    EventSettings settings_;
    std::shared_ptr<EventSink> sink_;
    std::deque<Event> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable idle_;
    std::atomic<size_t> stalls_{0};
    std::thread dispatcher_;

    void push(Event event);
    void dispatch_loop();
};
