#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/config.hpp>
#include <core/profile_store.hpp>
#include <ssh/transport.hpp>
#include "connection_pool.hpp"
#include "event_queue.hpp"
#include "history_store.hpp"
#include "port_forwarder.hpp"
#include "saved_command_store.hpp"
#include "session_manager.hpp"
#include "transfer_manager.hpp"

// Headless service facade: owns the pool and every manager, can be used by
// any frontend. Events go through a bounded queue to the sink set with
// set_sink().
class DeckService {
public:
    // libssh2 transports configured from config.dial().
    explicit DeckService(Config config);

    DeckService(Config config, std::shared_ptr<TransportDialer> dialer);
    ~DeckService();

    DeckService(const DeckService&) = delete;
    DeckService& operator=(const DeckService&) = delete;

    void set_sink(std::shared_ptr<EventSink> sink);

    // ── Connection lifecycle ──────────────────────────────────

    // Load the profile and acquire its pooled connection.
    Result<void> connect(const std::string& profile_name);

    // Stop the profile's command and forwards, then close its connection.
    void disconnect(const std::string& profile_name);

    std::vector<std::string> active_connections() const;

    // ── Commands ──────────────────────────────────────────────

    // Runs the command and records it in the profile's history.
    Result<std::string> execute(const std::string& profile, const std::string& command);
    Result<void> stop(const std::string& profile);
    SessionState session_state(const std::string& profile) const;

    // ── Saved commands ────────────────────────────────────────

    Result<std::vector<SavedCommand>> saved_commands() const;
    Result<void> save_command(const std::string& name, const std::string& command);
    Result<void> delete_saved(const std::string& name);

    // Look the name up and run it like execute(). ConfigError when unknown.
    Result<std::string> execute_saved(const std::string& profile, const std::string& name);

    // ── Port forwarding ───────────────────────────────────────

    Result<void> start_forward(const PortForwardEntry& entry);
    Result<void> stop_forward(const PortForwardEntry& entry);
    std::vector<PortForwardEntry> list_forwards(const std::string& profile);

    // ── Files ─────────────────────────────────────────────────

    Result<uint64_t> upload(const std::string& profile, const std::string& local_path,
                            const std::string& remote_path);
    Result<uint64_t> download(const std::string& profile, const std::string& remote_path,
                              const std::string& local_path);
    Result<std::vector<RemoteFileInfo>> list_dir(const std::string& profile, const std::string& path);
    Result<void> remove(const std::string& profile, const std::string& path);
    Result<void> rename(const std::string& profile, const std::string& from, const std::string& to);
    Result<void> mkdir(const std::string& profile, const std::string& path);

    // ── History & profiles ────────────────────────────────────

    Result<std::vector<std::string>> history(const std::string& profile) const;
    Result<std::string> create_synonym(const std::string& command);
    std::optional<std::string> resolve_synonym(const std::string& name);
    std::vector<Profile> profiles() const;

    // ── Shutdown ──────────────────────────────────────────────

    // Wait until queued events reached the sink.
    void flush_events();

    // Stop everything, close all connections. Idempotent.
    void shutdown();

    const Config& config() const { return config_; }

private:
    Config config_;
    ProfileStore profiles_;
    HistoryStore history_;
    SavedCommandStore saved_;
    std::shared_ptr<TransportDialer> dialer_;

    // Declared before the managers so it outlives them
    EventQueue events_;

    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<PortForwarder> forwards_;
    std::unique_ptr<TransferManager> transfers_;
    bool shut_down_ = false;
};
