#include "connection_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

ConnectionPool::ConnectionPool(std::shared_ptr<TransportDialer> dialer, PoolSettings settings)
    : dialer_(std::move(dialer)), settings_(settings) {}

ConnectionPool::~ConnectionPool() {
    close_all();
}

bool ConnectionPool::forget(const std::string& key, const std::shared_ptr<Transport>& transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(key);
    if (it == connections_.end() || it->second.transport != transport) return false;
    connections_.erase(it);
    return true;
}

void ConnectionPool::touch(const std::string& key, const std::shared_ptr<Transport>& transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(key);
    if (it != connections_.end() && it->second.transport == transport) {
        it->second.last_used = Clock::now();
    }
}

Result<std::shared_ptr<Transport>> ConnectionPool::acquire(const Profile& profile) {
    using R = Result<std::shared_ptr<Transport>>;
    const std::string& key = profile.name;

    auto valid = validate_profile(profile);
    if (valid.is_err()) return R::Err(valid);

    std::shared_ptr<Transport> existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end()) existing = it->second.transport;
    }

    // Liveness check may hit the network: outside the lock
    if (existing) {
        if (existing->is_alive()) {
            touch(key, existing);
            return R::Ok(existing);
        }
        sshdeck_log(fmt::format("ConnectionPool: {} is dead, redialing", key));
        if (forget(key, existing)) existing->close();
    }

    std::promise<R> promise;
    DialFuture shared;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end()) {
            // Someone else finished a dial meanwhile
            it->second.last_used = Clock::now();
            return R::Ok(it->second.transport);
        }
        auto pending = pending_.find(key);
        if (pending != pending_.end()) {
            shared = pending->second;
        } else {
            pending_[key] = promise.get_future().share();
            generation = releases_[key];
        }
    }

    if (shared.valid()) {
        sshdeck_log(fmt::format("ConnectionPool: waiting on in-flight dial for {}", key));
        return shared.get();
    }

    sshdeck_log(fmt::format("ConnectionPool: dialing {} ({}@{}:{})",
                            key, profile.username, profile.host, profile.port));
    R dialed;
    try {
        dialed = dialer_->dial(profile);
    } catch (const std::exception& e) {
        // Waiters must not be left on a dead promise
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(key);
        }
        sshdeck_log(fmt::format("ConnectionPool: dial {} threw: {}", key, e.what()));
        promise.set_exception(std::current_exception());
        throw;
    }

    bool released = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(key);
        released = releases_[key] != generation;
        if (dialed.is_ok() && !released) {
            auto now = Clock::now();
            connections_[key] = PooledConnection{dialed.value, now, now};
        }
    }

    if (dialed.is_ok() && released) {
        // release() or close_all() ran while the dial was in flight
        dialed.value->close();
        dialed = R::Err(ErrorKind::Dial,
                        fmt::format("Connection to '{}' was released while dialing", key));
    }

    if (dialed.is_ok()) {
        sshdeck_log(fmt::format("ConnectionPool: {} connected", key));
    } else {
        sshdeck_log(fmt::format("ConnectionPool: dial {} failed ({}): {}",
                                key, error_kind_name(dialed.kind), dialed.error));
    }
    promise.set_value(dialed);
    return dialed;
}

Result<std::shared_ptr<Transport>> ConnectionPool::lookup(const std::string& key) {
    using R = Result<std::shared_ptr<Transport>>;

    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end()) transport = it->second.transport;
    }
    if (!transport) {
        return R::Err(ErrorKind::Dial, fmt::format("Profile '{}' is not connected", key));
    }

    if (!transport->is_alive()) {
        if (forget(key, transport)) transport->close();
        return R::Err(ErrorKind::Dial, fmt::format("Connection for '{}' was lost", key));
    }

    touch(key, transport);
    return R::Ok(transport);
}

void ConnectionPool::release(const std::string& key) {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++releases_[key];
        auto it = connections_.find(key);
        if (it == connections_.end()) return;
        transport = it->second.transport;
        connections_.erase(it);
    }
    transport->close();
    sshdeck_log(fmt::format("ConnectionPool: released {}", key));
}

std::vector<std::string> ConnectionPool::list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(connections_.size());
    for (const auto& kv : connections_) keys.push_back(kv.first);
    return keys;
}

size_t ConnectionPool::sweep_idle() {
    auto idle_limit = std::chrono::seconds(settings_.idle_timeout_secs);
    std::vector<std::pair<std::string, std::shared_ptr<Transport>>> expired;
    std::vector<std::pair<std::string, std::shared_ptr<Transport>>> survivors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (now - it->second.last_used >= idle_limit) {
                expired.emplace_back(it->first, it->second.transport);
                it = connections_.erase(it);
            } else {
                survivors.emplace_back(it->first, it->second.transport);
                ++it;
            }
        }
    }

    for (auto& [key, transport] : expired) {
        sshdeck_log(fmt::format("ConnectionPool: {} idle for {}s, closing",
                                key, settings_.idle_timeout_secs));
        transport->close();
    }

    // Keepalive the rest; drop the ones that no longer answer
    size_t closed = expired.size();
    for (auto& [key, transport] : survivors) {
        if (transport->is_alive()) continue;
        if (forget(key, transport)) {
            sshdeck_log(fmt::format("ConnectionPool: {} lost, removing", key));
            transport->close();
            ++closed;
        }
    }
    return closed;
}

void ConnectionPool::sweeper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!sweeper_stop_) {
        sweep_cv_.wait_for(lock, std::chrono::seconds(settings_.sweep_interval_secs),
                           [this] { return sweeper_stop_; });
        if (sweeper_stop_) break;
        lock.unlock();
        sweep_idle();
        lock.lock();
    }
}

void ConnectionPool::start_sweeper() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sweeper_.joinable()) return;
    sweeper_stop_ = false;
    sweeper_ = std::thread(&ConnectionPool::sweeper_loop, this);
}

void ConnectionPool::stop_sweeper() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweeper_stop_ = true;
        t = std::move(sweeper_);
    }
    sweep_cv_.notify_all();
    if (t.joinable()) t.join();
}

void ConnectionPool::close_all() {
    stop_sweeper();

    std::map<std::string, PooledConnection> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(connections_);
        for (const auto& kv : pending_) ++releases_[kv.first];
    }
    for (auto& kv : local) {
        kv.second.transport->close();
    }
    if (!local.empty()) {
        sshdeck_log(fmt::format("ConnectionPool: closed {} connection(s)", local.size()));
    }
}
