#include "session_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <exception>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::Completed: return "completed";
        case SessionState::Errored: return "errored";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

static bool is_live(SessionState state) {
    return state == SessionState::Starting || state == SessionState::Running;
}

SessionManager::SessionManager(ConnectionPool& pool, EventSink& sink, SessionSettings settings)
    : pool_(pool), sink_(sink), settings_(settings) {}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::emit(const std::string& profile, SessionEventType type, const std::string& data) {
    sink_.on_session_event(SessionEvent{profile, type, data});
}

// ── Execute ─────────────────────────────────────────────────

Result<std::string> SessionManager::execute(const std::string& profile, const std::string& command) {
    std::string cmd = trimmed(command);
    if (cmd.empty()) {
        return Result<std::string>::Err(ErrorKind::Config, "Empty command");
    }

    // Terminal clear is local; nothing goes to the remote side
    if (to_lower(cmd) == "clear") {
        emit(profile, SessionEventType::Clear, "");
        return Result<std::string>::Ok(cmd);
    }

    auto session = std::make_shared<ActiveSession>();
    session->profile = profile;
    session->command = cmd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(profile);
        if (it != sessions_.end() && is_live(it->second->state.load())) {
            return Result<std::string>::Err(ErrorKind::SessionBusy,
                fmt::format("A command is already running for '{}': {}", profile, it->second->command));
        }
        sessions_[profile] = session;
    }

    auto transport = pool_.lookup(profile);
    if (transport.is_err()) {
        finish(session, SessionState::Errored);
        return Result<std::string>::Err(transport);
    }

    auto channel = transport.value->open_exec(cmd);
    if (channel.is_err()) {
        finish(session, SessionState::Errored);
        return Result<std::string>::Err(channel);
    }

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session->cancel.load()) {
            cancelled = true;
        } else {
            session->channel = channel.value;
            session->state = SessionState::Running;
        }
    }

    if (cancelled) {
        // stop() arrived while the channel was opening
        channel.value->close();
        emit(profile, SessionEventType::Info, "Command stopped");
        finish(session, SessionState::Stopped);
        return Result<std::string>::Ok(cmd);
    }

    sshdeck_log(fmt::format("SessionManager: [{}] running: {}", profile, cmd));
    runners_.spawn([this, session]() { run(session); });
    return Result<std::string>::Ok(cmd);
}

// ── Runner ──────────────────────────────────────────────────

void SessionManager::read_stream(const std::shared_ptr<ActiveSession>& session, ChannelStream stream) {
    const bool is_err = stream == ChannelStream::Stderr;
    const auto type = is_err ? SessionEventType::Stderr : SessionEventType::Stdout;
    const char* name = is_err ? "stderr" : "stdout";
    auto channel = session->channel;
    char buf[SSH_READ_BUF_SIZE];

    while (!session->cancel.load()) {
        long n;
        try {
            n = channel->read(stream, buf, sizeof(buf), READ_POLL_MS);
        } catch (const std::exception& e) {
            sshdeck_log(fmt::format("SessionManager: [{}] {} reader threw: {}",
                                    session->profile, name, e.what()));
            n = CHANNEL_ERROR;
        }
        if (n > 0) {
            emit(session->profile, type, std::string(buf, static_cast<size_t>(n)));
        } else if (n == CHANNEL_TIMEOUT) {
            continue;
        } else if (n == CHANNEL_EOF) {
            break;
        } else {
            if (!session->cancel.load()) {
                emit(session->profile, SessionEventType::Error,
                     fmt::format("Error reading {}: channel read failed", name));
            }
            break;
        }
    }
}

void SessionManager::run(std::shared_ptr<ActiveSession> session) {
    {
        TaskGroup readers("stderr:" + session->profile);
        readers.spawn([this, session]() { read_stream(session, ChannelStream::Stderr); });
        read_stream(session, ChannelStream::Stdout);
    }   // joins the stderr reader

    ExitStatus status;
    if (!session->cancel.load()) {
        status = session->channel->wait_exit(EXIT_STATUS_TIMEOUT_SECS * 1000);
    }
    session->channel->close();

    SessionState final_state;
    if (session->stop_requested.load()) {
        emit(session->profile, SessionEventType::Info, "Command stopped");
        final_state = SessionState::Stopped;
    } else if (!status.known) {
        emit(session->profile, SessionEventType::Error,
             "Command failed: exit status unavailable (connection closed)");
        final_state = SessionState::Errored;
    } else if (!status.signal.empty()) {
        emit(session->profile, SessionEventType::Error,
             fmt::format("Command terminated by signal {}", status.signal));
        final_state = SessionState::Errored;
    } else if (status.code != 0) {
        emit(session->profile, SessionEventType::Error,
             fmt::format("Command exited with code {}", status.code));
        final_state = SessionState::Errored;
    } else {
        emit(session->profile, SessionEventType::Info, "Command finished successfully");
        final_state = SessionState::Completed;
    }

    sshdeck_log(fmt::format("SessionManager: [{}] {} ({})", session->profile,
                            session->command, session_state_name(final_state)));
    finish(session, final_state);
}

void SessionManager::finish(const std::shared_ptr<ActiveSession>& session, SessionState final_state) {
    session->state = final_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->profile);
        if (it != sessions_.end() && it->second == session) sessions_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(session->done_mutex);
        session->done = true;
    }
    session->done_cv.notify_all();
}

// ── Stop ────────────────────────────────────────────────────

bool SessionManager::wait_done(const std::shared_ptr<ActiveSession>& session, int timeout_ms) {
    std::unique_lock<std::mutex> lock(session->done_mutex);
    if (timeout_ms < 0) {
        session->done_cv.wait(lock, [&] { return session->done; });
        return true;
    }
    return session->done_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                     [&] { return session->done; });
}

void SessionManager::force_close(const std::shared_ptr<ActiveSession>& session) {
    std::shared_ptr<ExecChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->cancel = true;
        channel = session->channel;
    }
    if (channel) channel->close();
}

Result<void> SessionManager::stop(const std::string& profile) {
    std::shared_ptr<ActiveSession> session;
    std::shared_ptr<ExecChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(profile);
        if (it == sessions_.end() || !is_live(it->second->state.load())) {
            return Result<void>::Err(ErrorKind::NoActiveSession,
                fmt::format("No command is running for '{}'", profile));
        }
        session = it->second;
        session->stop_requested = true;
        channel = session->channel;
        // Still opening: the execute path sees the flag and aborts
        if (!channel) session->cancel = true;
    }

    if (channel) {
        if (channel->send_signal("INT")) {
            sshdeck_log(fmt::format("SessionManager: [{}] sent SIGINT", profile));
        } else {
            sshdeck_log(fmt::format("SessionManager: [{}] signal request failed", profile));
        }
        if (!wait_done(session, settings_.stop_grace_ms)) {
            sshdeck_log(fmt::format("SessionManager: [{}] still running after {}ms, closing channel",
                                    profile, settings_.stop_grace_ms));
            force_close(session);
        }
    }

    wait_done(session, -1);
    return Result<void>::Ok();
}

void SessionManager::stop_all(const std::string& profile) {
    std::shared_ptr<ActiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(profile);
        if (it == sessions_.end()) return;
        session = it->second;
        session->stop_requested = true;
    }
    force_close(session);
    wait_done(session, -1);
}

void SessionManager::shutdown() {
    for (const auto& profile : active_profiles()) {
        stop_all(profile);
    }
    runners_.join_all();
}

SessionState SessionManager::state(const std::string& profile) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(profile);
    if (it == sessions_.end()) return SessionState::Idle;
    return it->second->state.load();
}

std::vector<std::string> SessionManager::active_profiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> profiles;
    for (const auto& kv : sessions_) profiles.push_back(kv.first);
    return profiles;
}
