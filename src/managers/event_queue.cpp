#include "event_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <exception>

EventQueue::EventQueue(EventSettings settings)
    : settings_(settings) {
    if (settings_.queue_capacity == 0) settings_.queue_capacity = 1;
    dispatcher_ = std::thread(&EventQueue::dispatch_loop, this);
}

EventQueue::~EventQueue() {
    stop();
}

void EventQueue::set_sink(std::shared_ptr<EventSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void EventQueue::on_session_event(const SessionEvent& event) {
    push(event);
}

void EventQueue::on_transfer_event(const TransferEvent& event) {
    push(event);
}

void EventQueue::push(Event event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_) return;

    // Backpressure: wait for room, never drop. stop() releases waiters.
    auto has_room = [this] { return queue_.size() < settings_.queue_capacity || stopping_; };
    if (!has_room()) {
        auto slice = std::chrono::milliseconds(std::max(settings_.stall_warn_ms, 1));
        if (!not_full_.wait_for(lock, slice, has_room)) {
            ++stalls_;
            sshdeck_log(fmt::format("EventQueue: sink stalled, producer waiting ({} queued)",
                                    queue_.size()));
            not_full_.wait(lock, has_room);
        }
    }
    if (stopping_) return;

    queue_.push_back(std::move(event));
    not_empty_.notify_one();
}

void EventQueue::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        not_empty_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty()) break;   // stopping and drained

        Event event = std::move(queue_.front());
        queue_.pop_front();
        auto sink = sink_;
        busy_ = true;
        not_full_.notify_one();
        lock.unlock();

        if (sink) {
            try {
                if (auto* s = std::get_if<SessionEvent>(&event)) {
                    sink->on_session_event(*s);
                } else {
                    sink->on_transfer_event(std::get<TransferEvent>(event));
                }
            } catch (const std::exception& e) {
                sshdeck_log(fmt::format("EventQueue: sink threw: {}", e.what()));
            }
        }

        lock.lock();
        busy_ = false;
        if (queue_.empty()) idle_.notify_all();
    }
    busy_ = false;
    idle_.notify_all();
}

void EventQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void EventQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
}
