#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// A supervised set of worker threads. Finished threads are joined lazily on
// the next spawn(); join_all() waits for everything, including tasks spawned
// while it runs. Never call join_all() from one of the group's own tasks.
class TaskGroup {
public:
    explicit TaskGroup(std::string name = "tasks");
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void()> fn);

    // Join threads that have already finished.
    void reap();

    void join_all();

    // Tasks still running.
    size_t size() const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string name_;
    std::list<Task> tasks_;
    mutable std::mutex mutex_;
};
