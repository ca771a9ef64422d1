#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <core/types.hpp>
#include <core/task_group.hpp>
#include <platform/socket_util.hpp>
#include <ssh/channel.hpp>
#include "connection_pool.hpp"

// A single active forward: listener + accept thread.
struct ForwardHandle {
    PortForwardEntry entry;
    std::atomic<bool> stop{false};
    std::atomic<bool> finished{false};    // accept loop has exited
    std::thread thread;
    socket_t listen_fd = SSHDECK_INVALID_SOCKET;        // LocalToRemote
    std::shared_ptr<RemoteListener> remote_listener;    // RemoteToLocal

    ~ForwardHandle();

    // Stop accepting and release the listener. Idempotent.
    void shutdown();

    // Non-copyable, non-movable (thread + atomic)
    ForwardHandle() = default;
    ForwardHandle(const ForwardHandle&) = delete;
    ForwardHandle& operator=(const ForwardHandle&) = delete;
};

// TCP forwards multiplexed over pooled connections.
//
//   LocalToRemote: listen on 127.0.0.1:local_port, each client gets a
//                  direct-tcpip channel to localhost:remote_port.
//   RemoteToLocal: the server listens on remote_bind_host:remote_port, each
//                  forwarded connection is dialed to 127.0.0.1:local_port.
//
// Every accepted pair is serviced by two copy tasks; when either direction
// ends both sides are closed.
class PortForwarder {
public:
    explicit PortForwarder(ConnectionPool& pool, ForwardSettings settings = {});
    ~PortForwarder();

    PortForwarder(const PortForwarder&) = delete;
    PortForwarder& operator=(const PortForwarder&) = delete;

    // Listen, DuplicateForward, Dial or Config errors.
    Result<void> start(const PortForwardEntry& entry);

    // Closes the listener before returning; pipes already accepted drain on
    // their own. ForwardNotFound when no such forward is active.
    Result<void> stop(const PortForwardEntry& entry);

    // Forwards whose listener is still alive.
    std::vector<PortForwardEntry> list(const std::string& profile);

    // Close every listener of the profile and abort its pipes.
    void stop_all(const std::string& profile);

    // In-flight copy tasks for the profile.
    size_t active_pipes(const std::string& profile) const;

    void shutdown();

private:
    ConnectionPool& pool_;
    ForwardSettings settings_;

    // Copy tasks of one profile, across all of its forwards.
    struct PipeSet {
        explicit PipeSet(const std::string& profile) : tasks("pipes:" + profile) {}
        TaskGroup tasks;
        std::shared_ptr<std::atomic<bool>> abort = std::make_shared<std::atomic<bool>>(false);
    };

    std::vector<std::shared_ptr<ForwardHandle>> forwards_;
    std::map<std::string, std::shared_ptr<PipeSet>> pipes_;
    mutable std::mutex mutex_;
    std::vector<PortForwardEntry> reserved_;   // start() in progress

    // Active or reserved.
    bool is_active_locked(const PortForwardEntry& entry) const;
    // Lookup plus local or remote listen; no registry lock held.
    Result<void> open_listener(ForwardHandle& handle);
    std::shared_ptr<PipeSet> pipe_set(const std::string& profile);

    void accept_local(std::shared_ptr<ForwardHandle> handle);
    void accept_remote(std::shared_ptr<ForwardHandle> handle);

    // Start the two copy tasks for one accepted connection.
    void spawn_pipes(const std::shared_ptr<ForwardHandle>& handle,
                     socket_t fd, std::shared_ptr<StreamChannel> channel);
};
