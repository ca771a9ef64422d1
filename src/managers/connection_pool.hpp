#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// Owns one authenticated transport per profile name. Consumers borrow the
// shared_ptr; only the pool closes a transport (release, idle sweep,
// close_all), after which borrowed channels fail with I/O errors.
class ConnectionPool {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionPool(std::shared_ptr<TransportDialer> dialer, PoolSettings settings = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Reuse the live connection for profile.name or dial a new one.
    // Concurrent callers for the same profile share a single dial.
    Result<std::shared_ptr<Transport>> acquire(const Profile& profile);

    // Existing connection only; ErrorKind::Dial when absent or dead.
    Result<std::shared_ptr<Transport>> lookup(const std::string& key);

    // Close and forget. An in-flight dial for key is discarded when it lands.
    void release(const std::string& key);

    // Sorted snapshot of pooled profile names.
    std::vector<std::string> list_active() const;

    // Close connections idle longer than idle_timeout, and any that died.
    // Returns how many were closed.
    size_t sweep_idle();

    void start_sweeper();
    void stop_sweeper();

    void close_all();

private:
    struct PooledConnection {
        std::shared_ptr<Transport> transport;
        Clock::time_point created;
        Clock::time_point last_used;
    };

    using DialFuture = std::shared_future<Result<std::shared_ptr<Transport>>>;

    std::shared_ptr<TransportDialer> dialer_;
    PoolSettings settings_;

    std::map<std::string, PooledConnection> connections_;
    std::map<std::string, DialFuture> pending_;
    std::map<std::string, uint64_t> releases_;   // bumped by release/close_all
    mutable std::mutex mutex_;

    std::thread sweeper_;
    std::condition_variable sweep_cv_;
    bool sweeper_stop_ = false;

    // Remove key only if it still maps to transport. Returns true if removed.
    bool forget(const std::string& key, const std::shared_ptr<Transport>& transport);
    void touch(const std::string& key, const std::shared_ptr<Transport>& transport);
    void sweeper_loop();
};
