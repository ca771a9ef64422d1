#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/task_group.hpp>
#include <ssh/channel.hpp>
#include "connection_pool.hpp"
#include "event_queue.hpp"

enum class SessionState { Idle, Starting, Running, Completed, Errored, Stopped };

const char* session_state_name(SessionState state);

// One remote command per profile, run as an exec request on a fresh channel
// of the pooled connection. Output is streamed to the sink as it arrives;
// every command ends with exactly one terminal info/error event, after which
// the profile is Idle again.
class SessionManager {
public:
    SessionManager(ConnectionPool& pool, EventSink& sink, SessionSettings settings = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Starts the command and returns its text. "clear" only emits a clear
    // event. SessionBusy while another command runs for the profile.
    Result<std::string> execute(const std::string& profile, const std::string& command);

    // SIGINT, then force close after the grace period. Returns once the
    // profile is Idle. NoActiveSession when nothing is running.
    Result<void> stop(const std::string& profile);

    // Force close without grace; no-op when idle.
    void stop_all(const std::string& profile);

    // Abort everything and join all runners.
    void shutdown();

    SessionState state(const std::string& profile) const;
    std::vector<std::string> active_profiles() const;

private:
    struct ActiveSession {
        std::string profile;
        std::string command;
        std::atomic<SessionState> state{SessionState::Starting};
        std::atomic<bool> cancel{false};
        std::atomic<bool> stop_requested{false};
        std::shared_ptr<ExecChannel> channel;   // guarded by SessionManager::mutex_

        std::mutex done_mutex;
        std::condition_variable done_cv;
        bool done = false;
    };

    ConnectionPool& pool_;
    EventSink& sink_;
    SessionSettings settings_;

    std::map<std::string, std::shared_ptr<ActiveSession>> sessions_;
    mutable std::mutex mutex_;
    TaskGroup runners_{"sessions"};

    void run(std::shared_ptr<ActiveSession> session);
    void read_stream(const std::shared_ptr<ActiveSession>& session, ChannelStream stream);

    // Unregister and wake stop() waiters.
    void finish(const std::shared_ptr<ActiveSession>& session, SessionState final_state);
    bool wait_done(const std::shared_ptr<ActiveSession>& session, int timeout_ms);
    void force_close(const std::shared_ptr<ActiveSession>& session);

    void emit(const std::string& profile, SessionEventType type, const std::string& data);
};
