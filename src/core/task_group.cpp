#include "task_group.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <exception>

TaskGroup::TaskGroup(std::string name) : name_(std::move(name)) {}

TaskGroup::~TaskGroup() {
    join_all();
}

void TaskGroup::spawn(std::function<void()> fn) {
    reap();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::string name = name_;
    std::thread t([fn = std::move(fn), done, name]() {
        try {
            fn();
        } catch (const std::exception& e) {
            sshdeck_log(fmt::format("TaskGroup[{}]: task failed: {}", name, e.what()));
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(Task{std::move(t), std::move(done)});
}

void TaskGroup::reap() {
    std::list<Task> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), tasks_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& task : finished) {
        if (task.thread.joinable()) task.thread.join();
    }
}

void TaskGroup::join_all() {
    while (true) {
        std::list<Task> local;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) return;
            local.swap(tasks_);
        }
        for (auto& task : local) {
            if (task.thread.joinable()) task.thread.join();
        }
    }
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t running = 0;
    for (const auto& task : tasks_) {
        if (!task.done->load()) ++running;
    }
    return running;
}
